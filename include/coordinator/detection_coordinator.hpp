#pragma once

#include "coordinator/detection_report.hpp"
#include "core/error.hpp"
#include "features/feature_builder.hpp"
#include "fusion/fusion_engine.hpp"
#include "models/model_registry.hpp"
#include "registry/detector_registry.hpp"
#include "store/iresult_store.hpp"

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Facade driving one detection run end to end:
 *
 *   records -> FeatureBuilder -> DetectorRegistry (parallel) -> FusionEngine
 *           -> context + feature importance -> Result Store
 *
 * detect_anomalies() never throws for expected failures; configuration and
 * feature extraction problems come back as a report with status ERROR.
 * A detector failure or timeout, or a store failure, degrades the report.
 *
 * Thread-safety: detect_anomalies() may run concurrently with itself and
 * with reconfigure(); each run works on the snapshot it started with.
 */
class DetectionCoordinator {
public:
    struct Config {
        FeatureBuilder::Config features;
        DetectorRegistry::Config registry;
        FusionEngine::Config fusion;
        size_t max_batch_size = 0;          // 0 = unlimited
        size_t top_features = 20;           // importance entries in the report
    };

    /**
     * @param detectors Detector set; empty = default_detector_configs()
     * @param store Result Store, or nullptr to disable persistence
     * @param models Model registry, or nullptr for a private empty one
     * @throws ConfigurationError on invalid detector configuration
     */
    DetectionCoordinator(const Config& config,
                         std::vector<DetectorConfig> detectors,
                         std::shared_ptr<IResultStore> store,
                         std::shared_ptr<ModelRegistry> models = nullptr);

    [[nodiscard]] DetectionReport detect_anomalies(
        const std::vector<Record>& records,
        const RunConfig& run_config = {},
        std::stop_token stop = {});

    /**
     * @brief Swap the detector set. Runs in flight keep their snapshot.
     * The new configs are also upserted into the Result Store.
     * @throws ConfigurationError if any config is invalid (old set stays active)
     */
    void reconfigure(const std::vector<DetectorConfig>& detectors);

    /**
     * @brief Record an expert verdict on a persisted anomaly.
     * feedback_value "confirmed" / "false_positive" feed feedback_summary().
     */
    [[nodiscard]] Result<FeedbackEntry> record_feedback(
        const std::string& anomaly_id,
        const std::string& feedback_type,
        const std::string& feedback_value,
        const std::string& expert_name,
        const std::string& comments = "");

    [[nodiscard]] Result<FeedbackSummary> feedback_summary(const std::string& detector_name) const;

    [[nodiscard]] std::shared_ptr<const DetectorRegistry::Snapshot> detectors() const {
        return registry_->snapshot();
    }

    [[nodiscard]] ModelRegistry& models() { return *models_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    void attach_context(std::vector<IntegratedAnomaly>& anomalies, const FeatureBatch& batch) const;
    void persist(DetectionReport& report,
                 const std::vector<DetectorPerformance>& performance,
                 const std::optional<FeatureImportance>& full_importance);

    Config config_;
    FeatureBuilder feature_builder_;
    FusionEngine fusion_;
    std::shared_ptr<IResultStore> store_;
    std::shared_ptr<ModelRegistry> models_;
    std::unique_ptr<DetectorRegistry> registry_;
};

} // namespace auditfusion
