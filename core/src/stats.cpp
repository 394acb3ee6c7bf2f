#include "embedcache/stats.hpp"
#include <nlohmann/json.hpp>

namespace embedcache {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(StoreStats, records, dimension, file_size,
                                   index_size, cache_size, cache_capacity,
                                   index_memory_bytes, cache_memory_bytes,
                                   memory_usage_bytes)

std::string stats_to_json(const StoreStats &stats) {
  nlohmann::json j = stats;
  return j.dump();
}

} // namespace embedcache
