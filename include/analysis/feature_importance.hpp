#pragma once

#include "core/types.hpp"
#include "features/feature_vector.hpp"

#include <optional>
#include <set>
#include <string>

namespace auditfusion {

/**
 * @brief Rank features by how strongly they separate flagged records.
 *
 * importance(f) = |mean(f | flagged) - mean(f | unflagged)| / stddev(f),
 * with stddev over the whole batch (0 when the feature is constant).
 * Ranked descending, ties by feature name.
 *
 * @return nullopt unless the batch holds both flagged and unflagged records
 */
[[nodiscard]] std::optional<FeatureImportance> compute_feature_importance(
    const FeatureBatch& batch, const std::set<std::string>& flagged_ids);

/// First n entries of a ranking
[[nodiscard]] FeatureImportance top_features(const FeatureImportance& importance, size_t n);

} // namespace auditfusion
