#pragma once

#include "store/iresult_store.hpp"
#include "store/jsonl_file.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace auditfusion {

/**
 * @brief Result Store writing one JSON-lines file per table under a directory:
 *
 *   runs.jsonl, anomalies.jsonl, detector_performance.jsonl,
 *   feature_importance.jsonl, detector_configs.jsonl, feedback.jsonl
 *
 * Rows are encoded before anything is written, so a row that cannot be
 * encoded leaves the files untouched. Rows are flushed per call. Detector config upserts append a
 * new row; the last row per name wins on load.
 */
class JsonlResultStore : public IResultStore {
public:
    /// @throws PersistenceError if the directory or a table file cannot be opened
    explicit JsonlResultStore(const std::string& directory);

    void append_run(const DetectionRun& run) override;
    void append_anomalies(const std::string& run_id,
                          const std::vector<IntegratedAnomaly>& anomalies) override;
    void append_performance(const std::vector<DetectorPerformance>& rows) override;
    void append_feature_importance(const std::string& run_id,
                                   const FeatureImportance& importance) override;

    void persist_run(const DetectionRun& run,
                     const std::vector<IntegratedAnomaly>& anomalies,
                     const std::vector<DetectorPerformance>& performance,
                     const std::optional<FeatureImportance>& importance) override;

    void upsert_detector_config(const DetectorConfig& config) override;
    [[nodiscard]] std::vector<DetectorConfig> load_detector_configs() const override;

    void append_feedback(const FeedbackEntry& entry) override;
    [[nodiscard]] std::vector<FeedbackEntry> feedback_for(const std::string& anomaly_id) const override;
    [[nodiscard]] FeedbackSummary feedback_summary(const std::string& detector_name) const override;

    [[nodiscard]] size_t run_count() const override;
    [[nodiscard]] size_t anomaly_count() const override;
    [[nodiscard]] std::string name() const override { return "jsonl:" + directory_; }

private:
    [[nodiscard]] static std::vector<std::string> encode(const std::vector<nlohmann::json>& rows);
    static void write_lines(JsonlFile& file, const std::vector<std::string>& lines);
    void append_rows(JsonlFile& file, const std::vector<nlohmann::json>& rows);

    [[nodiscard]] static std::vector<nlohmann::json> anomaly_rows(
        const std::string& run_id, const std::vector<IntegratedAnomaly>& anomalies);

    std::string directory_;
    std::unique_ptr<JsonlFile> runs_;
    std::unique_ptr<JsonlFile> anomalies_;
    std::unique_ptr<JsonlFile> performance_;
    std::unique_ptr<JsonlFile> importance_;
    std::unique_ptr<JsonlFile> configs_;
    std::unique_ptr<JsonlFile> feedback_;
    mutable std::mutex mutex_;
};

} // namespace auditfusion
