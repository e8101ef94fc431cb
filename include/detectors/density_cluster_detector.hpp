#pragma once

#include "detectors/idetector.hpp"

namespace auditfusion {

/**
 * @brief DBSCAN noise detector (type "dbscan").
 *
 * Runs on the robust-scaled batch with Euclidean distance. A point is core
 * when at least min_samples points (itself included) lie within eps; points
 * that are neither core nor within eps of a core point are noise and get
 * flagged with a fixed baseline confidence.
 */
class DensityClusterDetector : public IDetector {
public:
    /// @throws ConfigurationError on invalid params
    explicit DensityClusterDetector(const DetectorConfig& config);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string_view type() const override { return "dbscan"; }

    [[nodiscard]] std::vector<AnomalyCandidate> detect(
        const FeatureBatch& batch, const DetectionContext& ctx) const override;

    /// Noise mask for row-major points. Empty if stop was requested.
    [[nodiscard]] static std::vector<bool> noise_points(
        const std::vector<std::vector<double>>& points, double eps, size_t min_samples,
        std::stop_token stop = {});

private:
    std::string name_;
    double eps_ = 0.5;
    size_t min_samples_ = 5;
    double baseline_confidence_ = 0.8;
};

} // namespace auditfusion
