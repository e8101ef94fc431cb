#include "detectors/density_cluster_detector.hpp"
#include "core/error.hpp"
#include "core/stats.hpp"

#include <format>

namespace auditfusion {

DensityClusterDetector::DensityClusterDetector(const DetectorConfig& config)
    : name_(config.name) {
    eps_ = config.param<double>("eps", 0.5);
    const auto min_samples = config.param<int64_t>("min_samples", 5);
    baseline_confidence_ = config.param<double>("baseline_confidence", 0.8);

    if (!(eps_ > 0.0)) {
        throw ConfigurationError(std::format("detector '{}': eps must be > 0", name_));
    }
    if (min_samples < 1) {
        throw ConfigurationError(std::format("detector '{}': min_samples must be >= 1", name_));
    }
    if (baseline_confidence_ < 0.0 || baseline_confidence_ > 1.0) {
        throw ConfigurationError(
            std::format("detector '{}': baseline_confidence must be in [0, 1]", name_));
    }
    min_samples_ = static_cast<size_t>(min_samples);
}

std::vector<bool> DensityClusterDetector::noise_points(
    const std::vector<std::vector<double>>& points, double eps, size_t min_samples,
    std::stop_token stop) {

    const size_t n = points.size();
    const double eps2 = eps * eps;

    // Region queries (O(n^2)); batches are bounded by max_batch_size
    std::vector<std::vector<size_t>> neighbors(n);
    for (size_t i = 0; i < n; ++i) {
        if (stop.stop_requested()) return {};
        for (size_t j = 0; j < n; ++j) {
            if (stats::squared_distance(points[i], points[j]) <= eps2) {
                neighbors[i].push_back(j);
            }
        }
    }

    std::vector<bool> core(n, false);
    for (size_t i = 0; i < n; ++i) {
        core[i] = neighbors[i].size() >= min_samples;
    }

    std::vector<bool> noise(n, true);
    for (size_t i = 0; i < n; ++i) {
        if (core[i]) {
            noise[i] = false;
            continue;
        }
        for (const size_t j : neighbors[i]) {
            if (core[j]) {
                noise[i] = false;  // border point
                break;
            }
        }
    }
    return noise;
}

std::vector<AnomalyCandidate> DensityClusterDetector::detect(
    const FeatureBatch& batch, const DetectionContext& ctx) const {

    if (batch.empty()) return {};
    const auto rows = stats::robust_scale(batch.matrix());
    const auto noise = noise_points(rows, eps_, min_samples_, ctx.stop);
    if (noise.empty()) return {};

    std::vector<AnomalyCandidate> candidates;
    for (size_t i = 0; i < noise.size(); ++i) {
        if (!noise[i]) continue;
        const auto& fv = batch.vectors[i];
        AnomalyCandidate c;
        c.record_id = fv.record_id;
        c.record_index = fv.record_index;
        c.detector_name = name_;
        c.raw_score = 1.0;
        c.confidence = baseline_confidence_;
        c.anomaly_type = AnomalyType::PATTERN;
        c.explanation = std::format("density noise point (eps {}, min_samples {})",
                                    eps_, min_samples_);
        candidates.push_back(std::move(c));
    }
    return candidates;
}

} // namespace auditfusion
