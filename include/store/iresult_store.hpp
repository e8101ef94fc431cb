#pragma once

#include "core/types.hpp"
#include "detectors/detector_config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Append-mostly persistence for detection output and tuning data.
 *
 * Tables: runs, anomalies, detector_performance, feature_importance,
 * detector_configs (keyed by name, upsert), feedback (keyed by anomaly id).
 *
 * Every method throws PersistenceError on a storage failure.
 * Implementations must be safe to call from concurrent runs.
 */
class IResultStore {
public:
    virtual ~IResultStore() = default;

    virtual void append_run(const DetectionRun& run) = 0;

    virtual void append_anomalies(const std::string& run_id,
                                  const std::vector<IntegratedAnomaly>& anomalies) = 0;

    virtual void append_performance(const std::vector<DetectorPerformance>& rows) = 0;

    /// Full importance map (not only the reported top entries)
    virtual void append_feature_importance(const std::string& run_id,
                                           const FeatureImportance& importance) = 0;

    /**
     * @brief Write every row of one finished run.
     * Implementations that can encode rows up front write nothing when any
     * row is rejected.
     */
    virtual void persist_run(const DetectionRun& run,
                             const std::vector<IntegratedAnomaly>& anomalies,
                             const std::vector<DetectorPerformance>& performance,
                             const std::optional<FeatureImportance>& importance) {
        append_run(run);
        append_anomalies(run.run_id, anomalies);
        append_performance(performance);
        if (importance) append_feature_importance(run.run_id, *importance);
    }

    virtual void upsert_detector_config(const DetectorConfig& config) = 0;

    /// Latest config per detector name, ordered by name
    [[nodiscard]] virtual std::vector<DetectorConfig> load_detector_configs() const = 0;

    virtual void append_feedback(const FeedbackEntry& entry) = 0;

    [[nodiscard]] virtual std::vector<FeedbackEntry> feedback_for(
        const std::string& anomaly_id) const = 0;

    /**
     * @brief Validation feedback on anomalies the detector contributed to.
     * "confirmed" counts as a true positive, "false_positive" as a false one.
     */
    [[nodiscard]] virtual FeedbackSummary feedback_summary(
        const std::string& detector_name) const = 0;

    [[nodiscard]] virtual size_t run_count() const = 0;
    [[nodiscard]] virtual size_t anomaly_count() const = 0;

    /// Human-readable store name for logging (e.g. "jsonl:/var/lib/auditfusion")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace auditfusion
