#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace embedcache {

/**
 * @brief Bounded LRU cache of decoded vectors.
 *
 * Recency is kept in a list ordered most-recent first; both a hit and a put
 * move the entry to the front, and eviction always takes the back. An entry
 * that was never touched after its insertion is therefore evicted before any
 * entry inserted after it.
 *
 * The cache is never authoritative: the owning Store only puts keys that are
 * already in its index, and anything evicted is re-read from the log on the
 * next miss. Capacity 0 disables caching entirely.
 *
 * Not thread-safe. The owning Store serializes access.
 */
class HotCache {
public:
  explicit HotCache(size_t capacity) : capacity_(capacity) {}

  HotCache(const HotCache &) = delete;
  HotCache &operator=(const HotCache &) = delete;

  /// Copy of the cached vector, refreshing its recency. Misses have no effect.
  std::optional<std::vector<float>> get(std::string_view key) {
    auto it = map_.find(key);
    if (it == map_.end())
      return std::nullopt;
    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->vector;
  }

  /// Inserts or replaces `key` as the most recent entry.
  void put(std::string_view key, std::span<const float> vector) {
    if (capacity_ == 0)
      return;

    auto it = map_.find(key);
    if (it != map_.end()) {
      it->second->vector.assign(vector.begin(), vector.end());
      lru_.splice(lru_.begin(), lru_, it->second);
      return;
    }

    if (map_.size() >= capacity_)
      evict_one();

    lru_.push_front(Entry{std::string(key),
                          std::vector<float>(vector.begin(), vector.end())});
    map_.emplace(lru_.front().key, lru_.begin());
  }

  /// Membership test that does not touch recency.
  bool contains(std::string_view key) const {
    return map_.find(key) != map_.end();
  }

  /// Keys from most to least recently used.
  std::vector<std::string> keys_by_recency() const {
    std::vector<std::string> out;
    out.reserve(lru_.size());
    for (const auto &e : lru_)
      out.push_back(e.key);
    return out;
  }

  void clear() noexcept {
    map_.clear();
    lru_.clear();
  }

  size_t size() const noexcept { return map_.size(); }
  size_t capacity() const noexcept { return capacity_; }

private:
  struct Entry {
    std::string key;
    std::vector<float> vector;
  };

  /// Transparent hash so lookups by string_view do not allocate.
  struct KeyHash {
    using is_transparent = void;
    size_t operator()(std::string_view s) const noexcept {
      return std::hash<std::string_view>{}(s);
    }
  };

  void evict_one() {
    if (lru_.empty())
      return;
    map_.erase(lru_.back().key);
    lru_.pop_back();
  }

  size_t capacity_;
  std::list<Entry> lru_;
  std::unordered_map<std::string, std::list<Entry>::iterator, KeyHash,
                     std::equal_to<>>
      map_;
};

} // namespace embedcache
