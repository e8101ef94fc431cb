#pragma once

#include "core/types.hpp"
#include "detectors/detector_config.hpp"
#include "features/feature_vector.hpp"
#include "models/imodel.hpp"

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Per-call inputs handed to a detector by the DetectorRegistry.
 *
 * config is the run's snapshot; model is the registered handle for this
 * detector (nullptr when none). Detectors poll stop between expensive steps.
 */
struct DetectionContext {
    const DetectorConfig& config;
    std::shared_ptr<const IModel> model;
    std::stop_token stop;
    double contamination = 0.1;
};

/**
 * @brief Detector interface.
 *
 * Implementations are stateless between calls: anything fitted on a batch is
 * local to the detect() call. detect() may throw; the registry converts
 * ModelUnavailableError into "skipped" and anything else into "failed".
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    /// Unique instance name (matches DetectorConfig::name)
    [[nodiscard]] virtual const std::string& name() const = 0;

    /// Implementation type, e.g. "isolation_forest"
    [[nodiscard]] virtual std::string_view type() const = 0;

    /// True if the detector cannot run without a registered fitted model
    [[nodiscard]] virtual bool requires_fitted_model() const { return false; }

    [[nodiscard]] virtual std::vector<AnomalyCandidate> detect(
        const FeatureBatch& batch, const DetectionContext& ctx) const = 0;
};

} // namespace auditfusion
