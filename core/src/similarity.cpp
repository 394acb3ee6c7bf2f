#include "embedcache/similarity.hpp"
#include "embedcache/logging.hpp"
#include "embedcache/math_kernel.hpp"
#include <cmath>
#include <utility>

namespace embedcache {

Result<std::optional<Match>> find_best_match(const RecordLog &log,
                                             const KeyIndex &index,
                                             std::span<const float> query,
                                             float threshold) {
  if (query.size() != log.dim()) [[unlikely]]
    return std::unexpected(Error::DimensionMismatch);

  if (index.empty() || !(math::norm_sq(query) > 0.0f))
    return std::optional<Match>{};

  std::optional<Match> best;
  for (uint64_t offset : index.sorted_offsets()) {
    auto rec = log.read_at(offset);
    if (!rec) {
      EMBEDCACHE_LOG_ERROR("similarity scan: record at offset {} unreadable: {}",
                           offset, to_string(rec.error()));
      return std::unexpected(rec.error());
    }

    auto score = math::cosine_similarity(query, rec->vector);
    if (!score || !std::isfinite(*score))
      continue; // zero norm: similarity undefined

    if (!best || *score > best->score)
      best = Match{std::move(rec->key), std::move(rec->vector), *score};
  }

  if (best && best->score >= threshold)
    return best;
  return std::optional<Match>{};
}

} // namespace embedcache
