#pragma once

#include "store/iresult_store.hpp"

#include <map>
#include <shared_mutex>
#include <unordered_map>

namespace auditfusion {

/**
 * @brief In-process Result Store. Contents are lost on exit.
 */
class MemoryResultStore : public IResultStore {
public:
    MemoryResultStore() = default;

    void append_run(const DetectionRun& run) override;
    void append_anomalies(const std::string& run_id,
                          const std::vector<IntegratedAnomaly>& anomalies) override;
    void append_performance(const std::vector<DetectorPerformance>& rows) override;
    void append_feature_importance(const std::string& run_id,
                                   const FeatureImportance& importance) override;

    void upsert_detector_config(const DetectorConfig& config) override;
    [[nodiscard]] std::vector<DetectorConfig> load_detector_configs() const override;

    void append_feedback(const FeedbackEntry& entry) override;
    [[nodiscard]] std::vector<FeedbackEntry> feedback_for(const std::string& anomaly_id) const override;
    [[nodiscard]] FeedbackSummary feedback_summary(const std::string& detector_name) const override;

    [[nodiscard]] size_t run_count() const override;
    [[nodiscard]] size_t anomaly_count() const override;
    [[nodiscard]] std::string name() const override { return "memory"; }

    // Read-back for tests and tooling
    [[nodiscard]] std::vector<DetectionRun> runs() const;
    [[nodiscard]] std::vector<IntegratedAnomaly> anomalies_for(const std::string& run_id) const;
    [[nodiscard]] std::vector<DetectorPerformance> performance_for(const std::string& run_id) const;

private:
    struct StoredAnomaly {
        std::string run_id;
        IntegratedAnomaly anomaly;
    };

    std::vector<DetectionRun> runs_;
    std::vector<StoredAnomaly> anomalies_;
    std::unordered_map<std::string, size_t> anomaly_index_;     // anomaly_id -> anomalies_ slot
    std::vector<DetectorPerformance> performance_;
    std::vector<std::pair<std::string, FeatureImportance>> importance_;
    std::map<std::string, DetectorConfig> configs_;
    std::vector<FeedbackEntry> feedback_;
    mutable std::shared_mutex mutex_;
};

} // namespace auditfusion
