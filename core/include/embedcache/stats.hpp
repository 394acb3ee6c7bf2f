#pragma once

#include <cstdint>
#include <string>

namespace embedcache {

/**
 * @brief Point-in-time figures of one Store, derived on every call.
 *
 * Memory figures are accounting values, not allocator measurements:
 * 16 bytes per index entry and dimension × 4 bytes per cached vector.
 */
struct StoreStats {
  uint64_t records = 0;            // live keys (== index_size)
  uint64_t dimension = 0;
  uint64_t file_size = 0;          // log bytes, header and garbage included
  uint64_t index_size = 0;
  uint64_t cache_size = 0;
  uint64_t cache_capacity = 0;
  uint64_t index_memory_bytes = 0; // index_size * 16
  uint64_t cache_memory_bytes = 0; // cache_size * dimension * 4
  uint64_t memory_usage_bytes = 0; // index + cache
};

/// Serializes every field as a flat JSON object keyed by field name.
std::string stats_to_json(const StoreStats &stats);

} // namespace embedcache
