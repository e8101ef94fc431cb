#pragma once

#include "detectors/idetector.hpp"

#include <optional>

namespace auditfusion {

/**
 * @brief Reconstruction-error detector (type "autoencoder").
 *
 * A LinearAutoencoder reconstructs each robust-scaled vector. The cutoff is
 * the 100*(1-contamination) percentile of the batch errors; records above it
 * are flagged with confidence min(error/cutoff, 3) / 3.
 *
 * Params: latent_dim (0 = max(1, d/4)), contamination, fit_on_batch (true).
 * With fit_on_batch = false a registered model is required.
 */
class ReconstructionDetector : public IDetector {
public:
    /// @throws ConfigurationError on invalid params
    explicit ReconstructionDetector(const DetectorConfig& config);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string_view type() const override { return "autoencoder"; }
    [[nodiscard]] bool requires_fitted_model() const override { return !fit_on_batch_; }

    [[nodiscard]] std::vector<AnomalyCandidate> detect(
        const FeatureBatch& batch, const DetectionContext& ctx) const override;

private:
    std::string name_;
    size_t latent_dim_ = 0;
    std::optional<double> contamination_;
    bool fit_on_batch_ = true;
};

} // namespace auditfusion
