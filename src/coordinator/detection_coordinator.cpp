#include "coordinator/detection_coordinator.hpp"
#include "analysis/feature_importance.hpp"
#include "core/utils.hpp"

#include <format>
#include <set>

namespace auditfusion {

namespace {

void fail(DetectionReport& report, ErrorCategory category, const std::string& message) {
    report.status = RunStatus::ERROR;
    report.error_category = category;
    report.error_message = message;
    report.run.completed_at = utils::now();
    utils::log::error(std::format("Detection run {} aborted ({}): {}",
        report.run.run_id, error_category_to_string(category), message));
}

void cancel(DetectionReport& report) {
    report.status = RunStatus::CANCELLED;
    report.anomalies.clear();
    report.anomaly_count = 0;
    report.run.completed_at = utils::now();
    utils::log::warn(std::format("Detection run {} cancelled; nothing persisted",
                                 report.run.run_id));
}

} // anonymous namespace

DetectionCoordinator::DetectionCoordinator(const Config& config,
                                           std::vector<DetectorConfig> detectors,
                                           std::shared_ptr<IResultStore> store,
                                           std::shared_ptr<ModelRegistry> models)
    : config_(config),
      feature_builder_(config.features),
      fusion_(config.fusion),
      store_(std::move(store)),
      models_(models ? std::move(models) : std::make_shared<ModelRegistry>()) {
    if (detectors.empty()) {
        detectors = default_detector_configs();
    }
    if (const auto problem = config_.fusion.severity.validate(); !problem.empty()) {
        throw ConfigurationError(problem);
    }
    registry_ = std::make_unique<DetectorRegistry>(detectors, config_.registry);

    utils::log::info(std::format("DetectionCoordinator: {} detectors, {} workers, store={}",
        detectors.size(), config_.registry.max_workers, store_ ? store_->name() : "none"));
}

DetectionReport DetectionCoordinator::detect_anomalies(
    const std::vector<Record>& records,
    const RunConfig& run_config,
    std::stop_token stop) {

    utils::Timer timer;
    DetectionReport report;
    report.run.started_at = utils::now();
    report.run.run_id = utils::generate_run_id(report.run.started_at);
    report.total_records = records.size();

    utils::log::info(std::format("Detection run {} started: {} records",
                                 report.run.run_id, records.size()));

    // ---- Validate run config against this run's snapshot ------------------
    const auto snapshot = registry_->snapshot();
    for (const auto& name : run_config.detectors) {
        if (!snapshot->find(name)) {
            fail(report, ErrorCategory::CONFIGURATION_ERROR,
                 std::format("unknown detector '{}' in run config", name));
            return report;
        }
    }
    const double min_confidence = run_config.min_confidence.value_or(config_.fusion.min_confidence);
    if (!(min_confidence >= 0.0 && min_confidence <= 1.0)) {
        fail(report, ErrorCategory::CONFIGURATION_ERROR, "min_confidence must be in [0, 1]");
        return report;
    }

    if (config_.max_batch_size > 0 && records.size() > config_.max_batch_size) {
        fail(report, ErrorCategory::FEATURE_EXTRACTION_ERROR,
             std::format("batch of {} records exceeds max_batch_size {}",
                         records.size(), config_.max_batch_size));
        return report;
    }

    if (stop.stop_requested()) {
        cancel(report);
        return report;
    }

    // ---- Features ------------------------------------------------------------
    std::shared_ptr<const FeatureBatch> batch;
    try {
        batch = std::make_shared<const FeatureBatch>(feature_builder_.build(records));
    } catch (const FeatureExtractionError& e) {
        fail(report, ErrorCategory::FEATURE_EXTRACTION_ERROR, e.what());
        return report;
    }
    if (batch->empty()) {
        fail(report, ErrorCategory::FEATURE_EXTRACTION_ERROR,
             "feature builder produced no usable features");
        return report;
    }

    // ---- Detectors -------------------------------------------------------------
    try {
        report.detector_results = registry_->run_all(
            batch, snapshot, run_config.detectors, *models_, stop);
    } catch (const ConfigurationError& e) {
        fail(report, ErrorCategory::CONFIGURATION_ERROR, e.what());
        return report;
    } catch (const std::exception& e) {
        fail(report, ErrorCategory::INTERNAL_ERROR, e.what());
        return report;
    }

    for (const auto& [name, _] : report.detector_results) {
        report.run.detectors_used.push_back(name);
    }

    if (stop.stop_requested()) {
        cancel(report);
        return report;
    }

    // ---- Fusion -------------------------------------------------------------------
    std::vector<AnomalyCandidate> candidates;
    bool degraded = false;
    for (const auto& [name, result] : report.detector_results) {
        if (result.status == DetectorStatus::FAILED || result.status == DetectorStatus::TIMED_OUT) {
            degraded = true;
        }
        candidates.insert(candidates.end(), result.candidates.begin(), result.candidates.end());
    }

    std::set<std::string> rule_detectors;
    for (const auto& e : snapshot->entries) {
        if (e.detector->type() == "audit_rules") rule_detectors.insert(e.config.name);
    }

    report.anomalies = run_config.use_ensemble
        ? fusion_.fuse(candidates, snapshot->weights(), rule_detectors, min_confidence)
        : fusion_.union_all(candidates);
    report.anomaly_count = report.anomalies.size();
    attach_context(report.anomalies, *batch);

    // ---- Feature importance -------------------------------------------------------
    std::optional<FeatureImportance> full_importance;
    if (run_config.analyze_feature_importance) {
        std::set<std::string> flagged;
        for (const auto& a : report.anomalies) flagged.insert(a.record_id);
        full_importance = compute_feature_importance(*batch, flagged);
        if (full_importance) {
            report.feature_importance = top_features(*full_importance, config_.top_features);
        }
    }

    // ---- Metrics --------------------------------------------------------------------
    auto& metrics = report.run.metrics;
    metrics.detection_time_ms = timer.elapsed_ms_f();
    metrics.records_per_second = metrics.detection_time_ms > 0.0
        ? static_cast<double>(records.size()) / (metrics.detection_time_ms / 1000.0) : 0.0;
    metrics.anomaly_rate = records.empty()
        ? 0.0 : static_cast<double>(report.anomaly_count) / static_cast<double>(records.size());
    report.run.completed_at = utils::now();
    report.status = degraded ? RunStatus::DEGRADED : RunStatus::SUCCESS;

    // ---- Persistence ------------------------------------------------------------------
    if (run_config.persist && store_) {
        if (stop.stop_requested()) {
            cancel(report);
            return report;
        }
        const auto performance = DetectorRegistry::performance_rows(
            report.run.run_id, report.detector_results, batch->size());
        persist(report, performance, full_importance);
    }

    utils::log::info(std::format(
        "Detection run {} finished: status={}, {} anomalies / {} records, {:.1f} ms",
        report.run.run_id, run_status_to_string(report.status), report.anomaly_count,
        records.size(), metrics.detection_time_ms));
    return report;
}

void DetectionCoordinator::attach_context(std::vector<IntegratedAnomaly>& anomalies,
                                          const FeatureBatch& batch) const {
    const auto detected_at = utils::now();
    const auto& names = batch.schema->names;
    for (auto& a : anomalies) {
        a.context.detected_at = detected_at;
        a.context.feature_count = names.size();
        if (a.record_index >= batch.vectors.size()) continue;
        const auto& values = batch.vectors[a.record_index].values;
        for (size_t i = 0; i < names.size(); ++i) {
            a.context.feature_values[names[i]] = values[i];
        }
    }
}

void DetectionCoordinator::persist(DetectionReport& report,
                                   const std::vector<DetectorPerformance>& performance,
                                   const std::optional<FeatureImportance>& full_importance) {
    try {
        store_->persist_run(report.run, report.anomalies, performance, full_importance);
        report.persistence = PersistenceStatus::PERSISTED;
    } catch (const PersistenceError& e) {
        report.persistence = PersistenceStatus::FAILED;
        report.status = RunStatus::DEGRADED;
        report.error_category = ErrorCategory::PERSISTENCE_ERROR;
        report.error_message = e.what();
        utils::log::error(std::format("Detection run {}: persistence to {} failed: {}",
            report.run.run_id, store_->name(), e.what()));
    }
}

void DetectionCoordinator::reconfigure(const std::vector<DetectorConfig>& detectors) {
    registry_->reconfigure(detectors);

    if (!store_) return;
    try {
        for (const auto& cfg : detectors) {
            store_->upsert_detector_config(cfg);
        }
    } catch (const PersistenceError& e) {
        utils::log::warn(std::format("Detector configs applied but not persisted: {}", e.what()));
    }
}

Result<FeedbackEntry> DetectionCoordinator::record_feedback(
    const std::string& anomaly_id,
    const std::string& feedback_type,
    const std::string& feedback_value,
    const std::string& expert_name,
    const std::string& comments) {

    if (anomaly_id.empty() || feedback_type.empty()) {
        return Result<FeedbackEntry>::error(ErrorCategory::CONFIGURATION_ERROR,
            "feedback requires anomaly_id and feedback_type");
    }
    if (!store_) {
        return Result<FeedbackEntry>::error(ErrorCategory::PERSISTENCE_ERROR,
            "no result store configured");
    }

    FeedbackEntry entry;
    entry.feedback_id = utils::generate_uuid();
    entry.anomaly_id = anomaly_id;
    entry.feedback_type = feedback_type;
    entry.feedback_value = feedback_value;
    entry.expert_name = expert_name;
    entry.comments = comments;
    entry.feedback_time = utils::now();

    try {
        store_->append_feedback(entry);
    } catch (const PersistenceError& e) {
        utils::log::error(std::format("Feedback for anomaly {} not recorded: {}", anomaly_id, e.what()));
        return Result<FeedbackEntry>::error(ErrorCategory::PERSISTENCE_ERROR, e.what());
    }

    utils::log::info(std::format("Feedback recorded: anomaly={} {}={} by {}",
                                 anomaly_id, feedback_type, feedback_value, expert_name));
    return Result<FeedbackEntry>::ok(std::move(entry));
}

Result<FeedbackSummary> DetectionCoordinator::feedback_summary(const std::string& detector_name) const {
    if (!store_) {
        return Result<FeedbackSummary>::error(ErrorCategory::PERSISTENCE_ERROR,
            "no result store configured");
    }
    try {
        return Result<FeedbackSummary>::ok(store_->feedback_summary(detector_name));
    } catch (const PersistenceError& e) {
        return Result<FeedbackSummary>::error(ErrorCategory::PERSISTENCE_ERROR, e.what());
    }
}

} // namespace auditfusion
