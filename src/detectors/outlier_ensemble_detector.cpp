#include "detectors/outlier_ensemble_detector.hpp"
#include "core/error.hpp"
#include "core/stats.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace auditfusion {

OutlierEnsembleDetector::OutlierEnsembleDetector(const DetectorConfig& config)
    : name_(config.name) {
    const auto n_estimators = config.param<int64_t>("n_estimators", 100);
    const auto max_samples = config.param<int64_t>("max_samples", 256);
    if (n_estimators < 1) {
        throw ConfigurationError(std::format("detector '{}': n_estimators must be >= 1", name_));
    }
    if (max_samples < 2) {
        throw ConfigurationError(std::format("detector '{}': max_samples must be >= 2", name_));
    }
    params_.n_estimators = static_cast<size_t>(n_estimators);
    params_.max_samples = static_cast<size_t>(max_samples);
    params_.seed = config.param<uint64_t>("seed", 42);

    if (config.params.is_object() && config.params.contains("contamination")) {
        const double c = config.param<double>("contamination", 0.1);
        if (!(c > 0.0 && c <= 0.5)) {
            throw ConfigurationError(
                std::format("detector '{}': contamination must be in (0, 0.5]", name_));
        }
        contamination_ = c;
    }
}

std::vector<AnomalyCandidate> OutlierEnsembleDetector::detect(
    const FeatureBatch& batch, const DetectionContext& ctx) const {

    if (batch.empty()) return {};
    const auto rows = stats::robust_scale(batch.matrix());

    std::shared_ptr<const IsolationForest> forest;
    if (ctx.model && ctx.model->kind() == "isolation_forest" &&
        ctx.model->matches_schema(batch.schema->names)) {
        forest = std::static_pointer_cast<const IsolationForest>(ctx.model);
        utils::log::debug(std::format("{}: using registered forest", name_));
    } else {
        auto params = params_;
        params.contamination = contamination_.value_or(ctx.contamination);
        forest = IsolationForest::fit(rows, batch.schema->names, params, ctx.stop);
        if (!forest) return {};  // stop requested while fitting
    }

    std::vector<AnomalyCandidate> candidates;
    for (size_t i = 0; i < rows.size(); ++i) {
        const double decision = forest->decision(rows[i]);
        if (decision >= 0.0) continue;

        const auto& fv = batch.vectors[i];
        AnomalyCandidate c;
        c.record_id = fv.record_id;
        c.record_index = fv.record_index;
        c.detector_name = name_;
        c.raw_score = forest->anomaly_score(rows[i]);
        c.confidence = 1.0 / (1.0 + std::exp(decision));
        c.anomaly_type = AnomalyType::STATISTICAL;
        c.explanation = std::format("isolation forest outlier (score {:.3f})", c.raw_score);
        candidates.push_back(std::move(c));
    }
    return candidates;
}

} // namespace auditfusion
