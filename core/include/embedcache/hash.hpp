#pragma once

/**
 * @file hash.hpp
 * @brief Header-only FNV-1a 64-bit hash for index keys and snapshot checksums.
 *
 * The same function keys the in-memory index and checksums the entry block of
 * the index snapshot. It is not collision-free: the index always confirms a
 * hash hit against the key stored in the record log.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace embedcache::hash {

/// FNV-1a offset basis (64-bit).
inline constexpr uint64_t FNV1A_OFFSET_BASIS = 14695981039346656037ULL;

/// FNV-1a prime (64-bit).
inline constexpr uint64_t FNV1A_PRIME = 1099511628211ULL;

/**
 * @brief Continues an FNV-1a 64-bit digest over another byte range.
 *
 * @param seed  Digest so far (FNV1A_OFFSET_BASIS for a fresh hash).
 * @param data  Pointer to first byte.
 * @param size  Number of bytes to hash.
 */
constexpr uint64_t fnv1a_64_update(uint64_t seed, const void *data,
                                   size_t size) noexcept {
  const auto *bytes = static_cast<const uint8_t *>(data);
  uint64_t hash = seed;
  for (size_t i = 0; i < size; ++i) {
    hash ^= static_cast<uint64_t>(bytes[i]);
    hash *= FNV1A_PRIME;
  }
  return hash;
}

/// FNV-1a 64-bit digest of a byte range.
constexpr uint64_t fnv1a_64(const void *data, size_t size) noexcept {
  return fnv1a_64_update(FNV1A_OFFSET_BASIS, data, size);
}

/// Hash of an index key. Keys are opaque byte strings.
constexpr uint64_t key_hash(std::string_view key) noexcept {
  uint64_t hash = FNV1A_OFFSET_BASIS;
  for (char c : key) {
    hash ^= static_cast<uint64_t>(static_cast<uint8_t>(c));
    hash *= FNV1A_PRIME;
  }
  return hash;
}

} // namespace embedcache::hash
