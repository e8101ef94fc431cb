#include "store/memory_result_store.hpp"

#include <mutex>

namespace auditfusion {

void MemoryResultStore::append_run(const DetectionRun& run) {
    std::unique_lock lock(mutex_);
    runs_.push_back(run);
}

void MemoryResultStore::append_anomalies(const std::string& run_id,
                                         const std::vector<IntegratedAnomaly>& anomalies) {
    std::unique_lock lock(mutex_);
    for (const auto& a : anomalies) {
        anomaly_index_[a.anomaly_id] = anomalies_.size();
        anomalies_.push_back({run_id, a});
    }
}

void MemoryResultStore::append_performance(const std::vector<DetectorPerformance>& rows) {
    std::unique_lock lock(mutex_);
    performance_.insert(performance_.end(), rows.begin(), rows.end());
}

void MemoryResultStore::append_feature_importance(const std::string& run_id,
                                                  const FeatureImportance& importance) {
    std::unique_lock lock(mutex_);
    importance_.emplace_back(run_id, importance);
}

void MemoryResultStore::upsert_detector_config(const DetectorConfig& config) {
    std::unique_lock lock(mutex_);
    configs_[config.name] = config;
}

std::vector<DetectorConfig> MemoryResultStore::load_detector_configs() const {
    std::shared_lock lock(mutex_);
    std::vector<DetectorConfig> result;
    result.reserve(configs_.size());
    for (const auto& [_, cfg] : configs_) {
        result.push_back(cfg);
    }
    return result;
}

void MemoryResultStore::append_feedback(const FeedbackEntry& entry) {
    std::unique_lock lock(mutex_);
    feedback_.push_back(entry);
}

std::vector<FeedbackEntry> MemoryResultStore::feedback_for(const std::string& anomaly_id) const {
    std::shared_lock lock(mutex_);
    std::vector<FeedbackEntry> result;
    for (const auto& f : feedback_) {
        if (f.anomaly_id == anomaly_id) result.push_back(f);
    }
    return result;
}

FeedbackSummary MemoryResultStore::feedback_summary(const std::string& detector_name) const {
    std::shared_lock lock(mutex_);
    FeedbackSummary summary;
    summary.detector_name = detector_name;
    for (const auto& f : feedback_) {
        const auto it = anomaly_index_.find(f.anomaly_id);
        if (it == anomaly_index_.end()) continue;
        if (!anomalies_[it->second].anomaly.contributing_detectors.contains(detector_name)) continue;

        if (f.feedback_value == "confirmed") {
            ++summary.confirmed;
        } else if (f.feedback_value == "false_positive") {
            ++summary.false_positives;
        }
    }
    return summary;
}

size_t MemoryResultStore::run_count() const {
    std::shared_lock lock(mutex_);
    return runs_.size();
}

size_t MemoryResultStore::anomaly_count() const {
    std::shared_lock lock(mutex_);
    return anomalies_.size();
}

std::vector<DetectionRun> MemoryResultStore::runs() const {
    std::shared_lock lock(mutex_);
    return runs_;
}

std::vector<IntegratedAnomaly> MemoryResultStore::anomalies_for(const std::string& run_id) const {
    std::shared_lock lock(mutex_);
    std::vector<IntegratedAnomaly> result;
    for (const auto& s : anomalies_) {
        if (s.run_id == run_id) result.push_back(s.anomaly);
    }
    return result;
}

std::vector<DetectorPerformance> MemoryResultStore::performance_for(const std::string& run_id) const {
    std::shared_lock lock(mutex_);
    std::vector<DetectorPerformance> result;
    for (const auto& p : performance_) {
        if (p.run_id == run_id) result.push_back(p);
    }
    return result;
}

} // namespace auditfusion
