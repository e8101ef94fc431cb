#include "detectors/supervised_classifier_detector.hpp"
#include "core/error.hpp"
#include "models/tree_ensemble_classifier.hpp"

#include <format>

namespace auditfusion {

SupervisedClassifierDetector::SupervisedClassifierDetector(const DetectorConfig& config)
    : name_(config.name) {
    if (config.threshold < 0.0 || config.threshold > 1.0) {
        throw ConfigurationError(
            std::format("detector '{}': threshold must be a probability in [0, 1]", name_));
    }
}

std::vector<AnomalyCandidate> SupervisedClassifierDetector::detect(
    const FeatureBatch& batch, const DetectionContext& ctx) const {

    if (!ctx.model || ctx.model->kind() != "tree_ensemble") {
        throw ModelUnavailableError(std::format("no trained classifier registered for '{}'", name_));
    }
    if (batch.empty()) return {};

    const auto model = std::static_pointer_cast<const TreeEnsembleClassifier>(ctx.model);
    const auto binding = model->bind(batch.schema->names);
    const double threshold = ctx.config.threshold;

    std::vector<AnomalyCandidate> candidates;
    for (const auto& fv : batch.vectors) {
        if (ctx.stop.stop_requested()) return {};

        const double p = model->predict_proba(fv.values, binding);
        if (!(p > threshold)) continue;

        AnomalyCandidate c;
        c.record_id = fv.record_id;
        c.record_index = fv.record_index;
        c.detector_name = name_;
        c.raw_score = p;
        c.confidence = p;
        c.anomaly_type = AnomalyType::BUSINESS;
        c.explanation = std::format("classifier anomaly probability {:.3f}", p);
        candidates.push_back(std::move(c));
    }
    return candidates;
}

} // namespace auditfusion
