#include "detectors/reconstruction_detector.hpp"
#include "core/error.hpp"
#include "core/stats.hpp"
#include "models/linear_autoencoder.hpp"

#include <algorithm>
#include <format>

namespace auditfusion {

ReconstructionDetector::ReconstructionDetector(const DetectorConfig& config)
    : name_(config.name) {
    const auto latent = config.param<int64_t>("latent_dim", 0);
    if (latent < 0) {
        throw ConfigurationError(std::format("detector '{}': latent_dim must be >= 0", name_));
    }
    latent_dim_ = static_cast<size_t>(latent);
    fit_on_batch_ = config.param<bool>("fit_on_batch", true);

    if (config.params.is_object() && config.params.contains("contamination")) {
        const double c = config.param<double>("contamination", 0.1);
        if (!(c > 0.0 && c < 1.0)) {
            throw ConfigurationError(
                std::format("detector '{}': contamination must be in (0, 1)", name_));
        }
        contamination_ = c;
    }
}

std::vector<AnomalyCandidate> ReconstructionDetector::detect(
    const FeatureBatch& batch, const DetectionContext& ctx) const {

    std::shared_ptr<const LinearAutoencoder> model;
    if (ctx.model && ctx.model->kind() == "linear_autoencoder") {
        model = std::static_pointer_cast<const LinearAutoencoder>(ctx.model);
    }
    if (!fit_on_batch_ && !model) {
        throw ModelUnavailableError(std::format("no fitted autoencoder registered for '{}'", name_));
    }
    if (batch.empty()) return {};

    const auto rows = stats::robust_scale(batch.matrix());
    const double contamination = contamination_.value_or(ctx.contamination);

    if (model && !model->matches_schema(batch.schema->names)) {
        if (!fit_on_batch_) {
            throw ModelUnavailableError(
                std::format("registered autoencoder for '{}' does not match batch schema", name_));
        }
        model.reset();
    }
    if (!model) {
        LinearAutoencoder::Params params;
        params.latent_dim = latent_dim_;
        params.contamination = contamination;
        model = LinearAutoencoder::fit(rows, batch.schema->names, params, ctx.stop);
        if (!model) return {};  // stop requested while fitting
    }

    std::vector<double> errors;
    errors.reserve(rows.size());
    for (const auto& r : rows) {
        errors.push_back(model->reconstruction_error(r));
    }
    const double cutoff = stats::quantile(errors, 1.0 - contamination);

    std::vector<AnomalyCandidate> candidates;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (!(errors[i] > cutoff)) continue;

        const auto& fv = batch.vectors[i];
        const double ratio = cutoff > 0.0 ? errors[i] / cutoff : 3.0;

        AnomalyCandidate c;
        c.record_id = fv.record_id;
        c.record_index = fv.record_index;
        c.detector_name = name_;
        c.raw_score = errors[i];
        c.confidence = std::min(ratio, 3.0) / 3.0;
        c.anomaly_type = AnomalyType::PATTERN;
        c.explanation = std::format("reconstruction error {:.4f} above cutoff {:.4f}",
                                    errors[i], cutoff);
        candidates.push_back(std::move(c));
    }
    return candidates;
}

} // namespace auditfusion
