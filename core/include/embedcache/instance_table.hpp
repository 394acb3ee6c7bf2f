#pragma once

#include "embedcache/error.hpp"
#include "embedcache/store.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace embedcache {

/**
 * @brief Process-wide registry of open Stores addressed by integer handles.
 *
 * Handles encode a slot index and that slot's generation:
 *
 *   handle = (generation & 0x7FFF) << 16 | (slot + 1)
 *
 * so every handle is a positive int32. Closing a store bumps the slot
 * generation; a stale handle then names the right slot with the wrong
 * generation and is rejected with InvalidHandle in O(1).
 *
 * A slot whose generation has used all 15 bits is retired instead of
 * returned to the free list, so no handle value is ever issued twice.
 *
 * A path can be open at most once per process. Opening it again while it is
 * open fails with InvalidArgument rather than creating a second writer.
 * Once MAX_SLOTS slots are live or retired, open() fails with
 * ResourceExhausted.
 */
class InstanceTable {
public:
  static constexpr size_t MAX_SLOTS = 0xFFFF;
  static constexpr uint16_t MAX_GENERATION = 0x7FFF;

  static InstanceTable &global();

  InstanceTable() = default;
  InstanceTable(const InstanceTable &) = delete;
  InstanceTable &operator=(const InstanceTable &) = delete;

  /// Opens a Store and registers it. Returns the new handle.
  Result<int32_t> open(const std::filesystem::path &path,
                       const StoreOptions &options);

  /// Resolves a live handle. The Store stays alive while the pointer is held.
  Result<std::shared_ptr<Store>> get(int32_t handle) const;

  /// Unregisters the handle, then closes its Store.
  Result<void> close(int32_t handle);

  /// Number of open handles.
  size_t size() const;

private:
  struct Slot {
    uint16_t generation = 0;
    std::shared_ptr<Store> store;
    std::string key; // canonical path
  };

  static int32_t encode(size_t index, uint16_t generation) noexcept {
    const auto gen = static_cast<uint32_t>(generation & MAX_GENERATION);
    return static_cast<int32_t>((gen << 16) |
                                static_cast<uint32_t>(index + 1));
  }

  /// Slot index for a well-formed handle, or nullopt.
  std::optional<size_t> slot_of(int32_t handle) const noexcept;

  mutable std::shared_mutex mutex_;
  std::vector<Slot> slots_;
  std::vector<size_t> free_;
  size_t retired_ = 0;
  std::set<std::string> opening_; // paths with an open() or close() in flight
};

} // namespace embedcache
