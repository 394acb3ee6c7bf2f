#include "embedcache/instance_table.hpp"
#include "embedcache/logging.hpp"
#include <mutex>
#include <system_error>
#include <utility>

namespace embedcache {

namespace {

/// Identity of a path for the one-writer-per-process rule.
std::string path_key(const std::filesystem::path &path) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(path, ec);
  if (!ec)
    return canonical.string();
  auto absolute = std::filesystem::absolute(path, ec);
  return ec ? path.string() : absolute.lexically_normal().string();
}

} // namespace

InstanceTable &InstanceTable::global() {
  static InstanceTable table;
  return table;
}

std::optional<size_t> InstanceTable::slot_of(int32_t handle) const noexcept {
  if (handle <= 0)
    return std::nullopt;
  const auto raw = static_cast<uint32_t>(handle);
  const uint32_t low = raw & 0xFFFF;
  if (low == 0)
    return std::nullopt;
  const size_t index = low - 1;
  const auto generation = static_cast<uint16_t>(raw >> 16);
  if (index >= slots_.size() || !slots_[index].store ||
      slots_[index].generation != generation)
    return std::nullopt;
  return index;
}

Result<int32_t> InstanceTable::open(const std::filesystem::path &path,
                                    const StoreOptions &options) {
  const std::string key = path_key(path);

  {
    std::unique_lock lock(mutex_);
    bool busy = opening_.contains(key);
    for (const auto &slot : slots_)
      busy = busy || (slot.store && slot.key == key);
    if (busy) {
      EMBEDCACHE_LOG_ERROR("{} is already open in this process", key);
      return std::unexpected(Error::InvalidArgument);
    }
    if (free_.empty() && slots_.size() >= MAX_SLOTS)
      return std::unexpected(Error::ResourceExhausted);
    opening_.insert(key);
  }

  // Recovery may scan the whole log; run it outside the table lock.
  auto store = Store::open(path, options);

  std::unique_lock lock(mutex_);
  opening_.erase(key);
  if (!store)
    return std::unexpected(store.error());

  size_t index;
  if (!free_.empty()) {
    index = free_.back();
    free_.pop_back();
  } else if (slots_.size() < MAX_SLOTS) {
    index = slots_.size();
    slots_.emplace_back();
  } else {
    lock.unlock();
    if (auto r = (*store)->close(); !r)
      EMBEDCACHE_LOG_ERROR("closing unregistered store failed: {}",
                           to_string(r.error()));
    return std::unexpected(Error::ResourceExhausted);
  }

  Slot &slot = slots_[index];
  slot.store = std::shared_ptr<Store>(std::move(*store));
  slot.key = key;
  return encode(index, slot.generation);
}

Result<std::shared_ptr<Store>> InstanceTable::get(int32_t handle) const {
  std::shared_lock lock(mutex_);
  auto index = slot_of(handle);
  if (!index)
    return std::unexpected(Error::InvalidHandle);
  return slots_[*index].store;
}

Result<void> InstanceTable::close(int32_t handle) {
  std::shared_ptr<Store> store;
  std::string key;
  {
    std::unique_lock lock(mutex_);
    auto index = slot_of(handle);
    if (!index)
      return std::unexpected(Error::InvalidHandle);
    Slot &slot = slots_[*index];
    store = std::move(slot.store);
    slot.store.reset();
    key = std::move(slot.key);
    slot.key.clear();
    if (slot.generation < MAX_GENERATION) {
      ++slot.generation;
      free_.push_back(*index);
    } else {
      ++retired_;
      EMBEDCACHE_LOG_DEBUG("handle slot {} retired", *index);
    }
    // The path stays reserved until the snapshot is on disk.
    opening_.insert(key);
  }

  auto result = store->close();

  std::unique_lock lock(mutex_);
  opening_.erase(key);
  return result;
}

size_t InstanceTable::size() const {
  std::shared_lock lock(mutex_);
  return slots_.size() - free_.size() - retired_;
}

} // namespace embedcache
