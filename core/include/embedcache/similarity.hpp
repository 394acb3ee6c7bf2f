#pragma once

#include "embedcache/error.hpp"
#include "embedcache/key_index.hpp"
#include "embedcache/record_log.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace embedcache {

/// Best similarity hit: the stored key, its vector, and the cosine score.
struct Match {
  std::string key;
  std::vector<float> vector;
  float score;
};

/**
 * @brief Exhaustive cosine-similarity search over every live record.
 *
 * Live records are visited in ascending log offset. A candidate replaces the
 * current best only when its score is strictly greater, so among equal
 * scores the record written earliest in the log wins. Records with a zero
 * norm (or a non-finite score) never match. A zero-norm query matches
 * nothing.
 *
 * @return nullopt if the best score is below `threshold` or the index is
 *         empty. Log read failures (IOError, Corruption) are propagated.
 */
Result<std::optional<Match>> find_best_match(const RecordLog &log,
                                             const KeyIndex &index,
                                             std::span<const float> query,
                                             float threshold);

} // namespace embedcache
