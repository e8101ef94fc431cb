#pragma once

#include "detectors/idetector.hpp"

namespace auditfusion {

/**
 * @brief Tree-ensemble classifier detector (type "supervised_classifier").
 *
 * Requires a TreeEnsembleClassifier registered under the detector's name.
 * Flags records whose predicted probability exceeds the configured threshold;
 * confidence and raw score are the probability.
 *
 * @throws ModelUnavailableError (from detect) when no usable model is present
 */
class SupervisedClassifierDetector : public IDetector {
public:
    explicit SupervisedClassifierDetector(const DetectorConfig& config);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string_view type() const override { return "supervised_classifier"; }
    [[nodiscard]] bool requires_fitted_model() const override { return true; }

    [[nodiscard]] std::vector<AnomalyCandidate> detect(
        const FeatureBatch& batch, const DetectionContext& ctx) const override;

private:
    std::string name_;
};

} // namespace auditfusion
