#pragma once

#include "detectors/idetector.hpp"
#include "models/isolation_forest.hpp"

#include <optional>

namespace auditfusion {

/**
 * @brief Isolation-forest outlier detector (type "isolation_forest").
 *
 * Uses a registered forest when its schema matches the batch, otherwise fits
 * one on the robust-scaled batch inside the worker task. A record is flagged
 * when decision(x) < 0; confidence = 1 / (1 + e^decision), so every flagged
 * record has confidence above 0.5.
 *
 * Params: n_estimators, max_samples, seed, contamination (falls back to the
 * engine default).
 */
class OutlierEnsembleDetector : public IDetector {
public:
    /// @throws ConfigurationError on invalid params
    explicit OutlierEnsembleDetector(const DetectorConfig& config);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string_view type() const override { return "isolation_forest"; }

    [[nodiscard]] std::vector<AnomalyCandidate> detect(
        const FeatureBatch& batch, const DetectionContext& ctx) const override;

private:
    std::string name_;
    IsolationForest::Params params_;
    std::optional<double> contamination_;
};

} // namespace auditfusion
