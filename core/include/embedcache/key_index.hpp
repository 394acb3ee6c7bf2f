#pragma once

#include "embedcache/error.hpp"
#include "embedcache/hash.hpp"
#include "embedcache/schema.hpp"
#include <concepts>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace embedcache {

/// Confirms that the record at a log offset carries the probed key.
template <typename F>
concept KeyMatcher = std::invocable<F &, uint64_t> &&
                     std::same_as<std::invoke_result_t<F &, uint64_t>,
                                  Result<bool>>;

/**
 * @brief In-memory key → latest log offset map.
 *
 * Only the 64-bit FNV-1a hash of a key is kept, so a lookup may see several
 * candidate offsets for one hash. Callers pass a matcher that reads the key
 * back from the record log; a candidate counts only once the matcher accepts
 * it. Keys therefore never alias, even under a hash collision.
 *
 * Not thread-safe. The owning Store serializes access.
 */
class KeyIndex {
public:
  /**
   * @brief Offset of the live record for `key`, or nullopt.
   * @return Matcher errors (IOError, Corruption) are propagated.
   */
  template <KeyMatcher Matcher>
  Result<std::optional<uint64_t>> find(std::string_view key,
                                       Matcher &&matches) const {
    const uint64_t h = hash::key_hash(key);
    auto [it, last] = entries_.equal_range(h);
    for (; it != last; ++it) {
      auto ok = matches(it->second);
      if (!ok)
        return std::unexpected(ok.error());
      if (*ok)
        return std::optional<uint64_t>{it->second};
    }
    return std::optional<uint64_t>{};
  }

  /**
   * @brief Points `key` at `offset`.
   *
   * @param previous Offset returned by an earlier find() for the same key,
   *                 replaced in place; nullopt inserts a new entry.
   */
  void assign(std::string_view key, std::optional<uint64_t> previous,
              uint64_t offset);

  /// find() followed by assign(). Returns true if the key was new.
  template <KeyMatcher Matcher>
  Result<bool> put(std::string_view key, uint64_t offset, Matcher &&matches) {
    auto prev = find(key, matches);
    if (!prev)
      return std::unexpected(prev.error());
    assign(key, *prev, offset);
    return !prev->has_value();
  }

  size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  void clear() noexcept { entries_.clear(); }

  /// Accounting footprint: one hash and one offset per live key.
  size_t memory_bytes() const noexcept {
    return entries_.size() * INDEX_ENTRY_FOOTPRINT;
  }

  /// Every live offset in ascending (log) order.
  std::vector<uint64_t> sorted_offsets() const;

  // ═══════════════════════════════════════════════════════════════════════
  // Snapshot persistence
  // ═══════════════════════════════════════════════════════════════════════

  /// `<log path>.idx`
  static std::filesystem::path snapshot_path_for(
      const std::filesystem::path &log_path);

  /**
   * @brief Writes the snapshot to a temporary file and renames it into place.
   * @param log_length Log byte length the entries are valid for.
   */
  Result<void> save_snapshot(const std::filesystem::path &path, uint32_t dim,
                             uint64_t log_length) const;

  /**
   * @brief Replaces the contents with a snapshot if it applies to the log.
   *
   * The snapshot is rejected unless magic, version, dim, entry count,
   * checksum and `log_length` all agree and every offset lies inside the
   * log. On rejection the index is left untouched.
   *
   * @return IOError if the file is missing or unreadable, InvalidFormat for a
   *         foreign or stale header, Corruption for a bad entry block.
   */
  Result<void> load_snapshot(const std::filesystem::path &path, uint32_t dim,
                             uint64_t log_length);

private:
  std::unordered_multimap<uint64_t, uint64_t> entries_;
};

} // namespace embedcache
