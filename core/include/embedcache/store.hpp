#pragma once

#include "embedcache/error.hpp"
#include "embedcache/hot_cache.hpp"
#include "embedcache/key_index.hpp"
#include "embedcache/record_log.hpp"
#include "embedcache/schema.hpp"
#include "embedcache/similarity.hpp"
#include "embedcache/stats.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace embedcache {

/// Parameters fixed for the lifetime of an open Store.
struct StoreOptions {
  /// Embedding dimension. Must match the header of an existing log.
  uint32_t dim = 0;
  /// Hot Cache bound in vectors; 0 disables the cache.
  size_t cache_capacity = CACHE_CAPACITY_DEFAULT;
  /// Write `<path>.idx` on flush() and close().
  bool persist_snapshot = true;
  /// fsync the log before it is closed.
  bool sync_on_close = true;
};

/// How the index was populated at open.
enum class IndexSource { Fresh, Snapshot, Rebuilt };

/**
 * @brief One open embedding database: record log, index and hot cache.
 *
 * Every public operation takes the store mutex, so concurrent calls on the
 * same Store are serialized; distinct Stores never contend.
 *
 * After close() every operation fails with Error::InvalidHandle.
 */
class Store {
public:
  /**
   * @brief Opens or creates the store at `path`.
   *
   * The index comes from `<path>.idx` when that snapshot matches the log
   * exactly, otherwise from a full log scan. A torn trailing record found
   * by the scan is cut off and logged.
   */
  static Result<std::unique_ptr<Store>> open(std::filesystem::path path,
                                             const StoreOptions &options);

  ~Store();

  Store(const Store &) = delete;
  Store &operator=(const Store &) = delete;

  /// Appends `vector` under `key`; a repeated key supersedes the old value.
  Result<void> insert(std::string_view key, std::span<const float> vector);

  /// Latest vector for `key`, or nullopt if the key was never inserted.
  Result<std::optional<std::vector<float>>> get(std::string_view key);

  /// Index-only membership test; never reads a vector.
  Result<bool> contains(std::string_view key);

  /// Best cosine match at or above `threshold`. Bypasses the Hot Cache.
  Result<std::optional<Match>> find_similar(std::span<const float> query,
                                            float threshold);

  Result<StoreStats> stats() const;

  /// Persists the snapshot and syncs the log without closing.
  Result<void> flush();

  /**
   * @brief Persists the snapshot, syncs and releases the log.
   * The store is closed afterwards even if persisting failed; the first
   * failure is reported.
   */
  Result<void> close();

  bool is_open() const;
  uint32_t dim() const noexcept { return options_.dim; }
  const std::filesystem::path &path() const noexcept { return path_; }
  const StoreOptions &options() const noexcept { return options_; }
  IndexSource index_source() const noexcept { return index_source_; }

private:
  Store(std::filesystem::path path, const StoreOptions &options,
        RecordLog log);

  Result<void> build_index();
  Result<void> rebuild_index();
  Result<void> persist_locked();
  Result<void> close_locked();

  std::filesystem::path path_;
  StoreOptions options_;
  RecordLog log_;
  KeyIndex index_;
  HotCache cache_;
  IndexSource index_source_ = IndexSource::Fresh;
  bool open_ = true;
  mutable std::mutex mutex_;
};

} // namespace embedcache
