#pragma once

#include "core/types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Severity thresholds. First match wins, boundaries are inclusive.
 */
struct SeverityPolicy {
    double critical_confidence = 0.9;
    double critical_score = 3.0;
    double high_confidence = 0.8;
    double high_score = 2.0;
    double medium_confidence = 0.7;
    double medium_score = 1.0;

    [[nodiscard]] Severity classify(double confidence, double combined_score) const;

    /// @return Empty string if valid, otherwise the first problem found
    [[nodiscard]] std::string validate() const;
};

/**
 * @brief Merges per-detector candidates into one IntegratedAnomaly per record.
 *
 * Ensemble mode, per record_id group:
 *   total_weight        = sum of contributing detector weights
 *   combined_confidence = sum(conf_i * w_i) / total_weight
 *   combined_score      = sum(score_i * w_i) / total_weight
 * Groups below min_confidence (or with total_weight 0) are dropped; the rest
 * get a severity and are sorted by confidence desc, record_id asc.
 *
 * Summation order within a group is fixed (detector name ascending), so two
 * calls on the same candidates give bit-identical results.
 *
 * The engine is stateless apart from its Config; fuse() is thread-safe.
 */
class FusionEngine {
public:
    struct Config {
        double min_confidence = 0.7;
        SeverityPolicy severity;
        double default_weight = 1.0;    // for detectors missing from the weight map
    };

    FusionEngine() : FusionEngine(Config{}) {}
    explicit FusionEngine(Config config);

    /**
     * @brief Weighted fusion.
     * @param weights Detector name -> weight
     * @param authoritative Detectors whose anomaly type overrides the majority vote
     * @param min_confidence Global threshold for this run
     */
    [[nodiscard]] std::vector<IntegratedAnomaly> fuse(
        const std::vector<AnomalyCandidate>& candidates,
        const std::map<std::string, double>& weights,
        const std::set<std::string>& authoritative,
        double min_confidence) const;

    [[nodiscard]] std::vector<IntegratedAnomaly> fuse(
        const std::vector<AnomalyCandidate>& candidates,
        const std::map<std::string, double>& weights,
        const std::set<std::string>& authoritative) const {
        return fuse(candidates, weights, authoritative, config_.min_confidence);
    }

    /**
     * @brief Unweighted union: per record the highest-confidence candidate
     * sets confidence, score and type. No min_confidence filter.
     */
    [[nodiscard]] std::vector<IntegratedAnomaly> union_all(
        const std::vector<AnomalyCandidate>& candidates) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    /// Candidates grouped by record_id, each group sorted by detector name
    [[nodiscard]] static std::map<std::string, std::vector<const AnomalyCandidate*>> group(
        const std::vector<AnomalyCandidate>& candidates);

    [[nodiscard]] static AnomalyType vote_type(
        const std::vector<const AnomalyCandidate*>& group,
        const std::set<std::string>& authoritative);

    [[nodiscard]] static std::string explain(const std::vector<const AnomalyCandidate*>& group);

    static void rank(std::vector<IntegratedAnomaly>& anomalies);

    Config config_;
};

} // namespace auditfusion
