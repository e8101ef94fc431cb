#include "analysis/feature_importance.hpp"
#include "core/stats.hpp"

#include <algorithm>
#include <cmath>

namespace auditfusion {

std::optional<FeatureImportance> compute_feature_importance(
    const FeatureBatch& batch, const std::set<std::string>& flagged_ids) {

    if (batch.empty()) return std::nullopt;

    size_t flagged_count = 0;
    for (const auto& fv : batch.vectors) {
        if (flagged_ids.contains(fv.record_id)) ++flagged_count;
    }
    if (flagged_count == 0 || flagged_count == batch.size()) return std::nullopt;

    FeatureImportance fi;
    fi.method = "mean_shift";

    const auto& names = batch.schema->names;
    std::vector<double> all, flagged, rest;
    for (size_t f = 0; f < names.size(); ++f) {
        all.clear();
        flagged.clear();
        rest.clear();
        for (const auto& fv : batch.vectors) {
            const double v = fv.values[f];
            all.push_back(v);
            (flagged_ids.contains(fv.record_id) ? flagged : rest).push_back(v);
        }

        const double sd = stats::sample_stddev(all);
        double score = 0.0;
        if (sd > 0.0) {
            score = std::abs(stats::mean(flagged) - stats::mean(rest)) / sd;
        }
        if (!std::isfinite(score)) score = 0.0;
        fi.ranked.emplace_back(names[f], score);
    }

    std::stable_sort(fi.ranked.begin(), fi.ranked.end(),
        [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });
    return fi;
}

FeatureImportance top_features(const FeatureImportance& importance, size_t n) {
    FeatureImportance top;
    top.method = importance.method;
    const size_t count = std::min(n, importance.ranked.size());
    top.ranked.assign(importance.ranked.begin(),
                      importance.ranked.begin() + static_cast<std::ptrdiff_t>(count));
    return top;
}

} // namespace auditfusion
