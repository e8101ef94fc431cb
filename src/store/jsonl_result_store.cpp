#include "store/jsonl_result_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "serialization/json_codec.hpp"

#include <filesystem>
#include <format>
#include <map>
#include <set>

namespace auditfusion {

JsonlResultStore::JsonlResultStore(const std::string& directory)
    : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw PersistenceError(std::format("Cannot create store directory {}: {}",
                                           directory_, ec.message()));
    }

    const std::filesystem::path dir(directory_);
    runs_ = std::make_unique<JsonlFile>((dir / "runs.jsonl").string());
    anomalies_ = std::make_unique<JsonlFile>((dir / "anomalies.jsonl").string());
    performance_ = std::make_unique<JsonlFile>((dir / "detector_performance.jsonl").string());
    importance_ = std::make_unique<JsonlFile>((dir / "feature_importance.jsonl").string());
    configs_ = std::make_unique<JsonlFile>((dir / "detector_configs.jsonl").string());
    feedback_ = std::make_unique<JsonlFile>((dir / "feedback.jsonl").string());

    utils::log::info(std::format("Result store opened: {}", name()));
}

std::vector<std::string> JsonlResultStore::encode(const std::vector<nlohmann::json>& rows) {
    std::vector<std::string> lines;
    lines.reserve(rows.size());
    for (const auto& row : rows) {
        lines.push_back(JsonlFile::serialize(row));
    }
    return lines;
}

void JsonlResultStore::write_lines(JsonlFile& file, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        if (!file.write(line)) {
            throw PersistenceError("Write failed on store file: " + file.path());
        }
    }
    file.flush();
}

void JsonlResultStore::append_rows(JsonlFile& file, const std::vector<nlohmann::json>& rows) {
    const auto lines = encode(rows);
    write_lines(file, lines);
}

std::vector<nlohmann::json> JsonlResultStore::anomaly_rows(
    const std::string& run_id, const std::vector<IntegratedAnomaly>& anomalies) {
    std::vector<nlohmann::json> rows;
    rows.reserve(anomalies.size());
    for (const auto& a : anomalies) {
        nlohmann::json row = a;
        row["run_id"] = run_id;
        rows.push_back(std::move(row));
    }
    return rows;
}

void JsonlResultStore::append_run(const DetectionRun& run) {
    const auto lines = encode({nlohmann::json(run)});
    std::lock_guard<std::mutex> lock(mutex_);
    write_lines(*runs_, lines);
}

void JsonlResultStore::append_anomalies(const std::string& run_id,
                                        const std::vector<IntegratedAnomaly>& anomalies) {
    const auto lines = encode(anomaly_rows(run_id, anomalies));
    std::lock_guard<std::mutex> lock(mutex_);
    write_lines(*anomalies_, lines);
}

void JsonlResultStore::persist_run(const DetectionRun& run,
                                   const std::vector<IntegratedAnomaly>& anomalies,
                                   const std::vector<DetectorPerformance>& performance,
                                   const std::optional<FeatureImportance>& importance) {
    // Encode every table first; nothing is written if any row is rejected
    const auto run_lines = encode({nlohmann::json(run)});
    const auto anomaly_lines = encode(anomaly_rows(run.run_id, anomalies));
    const auto performance_lines = encode(
        std::vector<nlohmann::json>(performance.begin(), performance.end()));
    std::vector<std::string> importance_lines;
    if (importance) {
        nlohmann::json row = *importance;
        row["run_id"] = run.run_id;
        importance_lines = encode({row});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    write_lines(*runs_, run_lines);
    write_lines(*anomalies_, anomaly_lines);
    write_lines(*performance_, performance_lines);
    if (importance) write_lines(*importance_, importance_lines);
}

void JsonlResultStore::append_performance(const std::vector<DetectorPerformance>& rows) {
    std::vector<nlohmann::json> json_rows(rows.begin(), rows.end());
    std::lock_guard<std::mutex> lock(mutex_);
    append_rows(*performance_, json_rows);
}

void JsonlResultStore::append_feature_importance(const std::string& run_id,
                                                 const FeatureImportance& importance) {
    nlohmann::json row = importance;
    row["run_id"] = run_id;
    std::lock_guard<std::mutex> lock(mutex_);
    append_rows(*importance_, {row});
}

void JsonlResultStore::upsert_detector_config(const DetectorConfig& config) {
    nlohmann::json row = config;
    row["updated_at"] = codec::timestamp_to_string(utils::now());
    std::lock_guard<std::mutex> lock(mutex_);
    append_rows(*configs_, {row});
}

std::vector<DetectorConfig> JsonlResultStore::load_detector_configs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, DetectorConfig> latest;
    try {
        for (const auto& row : configs_->read_all()) {
            auto cfg = row.get<DetectorConfig>();
            latest[cfg.name] = std::move(cfg);
        }
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(std::format("Malformed detector config row: {}", e.what()));
    }

    std::vector<DetectorConfig> result;
    result.reserve(latest.size());
    for (auto& [_, cfg] : latest) {
        result.push_back(std::move(cfg));
    }
    return result;
}

void JsonlResultStore::append_feedback(const FeedbackEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_rows(*feedback_, {nlohmann::json(entry)});
}

std::vector<FeedbackEntry> JsonlResultStore::feedback_for(const std::string& anomaly_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FeedbackEntry> result;
    try {
        for (const auto& row : feedback_->read_all()) {
            if (row.value("anomaly_id", std::string{}) != anomaly_id) continue;
            result.push_back(row.get<FeedbackEntry>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(std::format("Malformed feedback row: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        throw PersistenceError(std::format("Malformed feedback timestamp: {}", e.what()));
    }
    return result;
}

FeedbackSummary JsonlResultStore::feedback_summary(const std::string& detector_name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    FeedbackSummary summary;
    summary.detector_name = detector_name;
    try {
        std::set<std::string> contributed;
        for (const auto& row : anomalies_->read_all()) {
            const auto it = row.find("contributing_detectors");
            if (it == row.end() || !it->is_array()) continue;
            for (const auto& d : *it) {
                if (d.is_string() && d.get<std::string>() == detector_name) {
                    contributed.insert(row.value("anomaly_id", std::string{}));
                    break;
                }
            }
        }

        for (const auto& row : feedback_->read_all()) {
            if (!contributed.contains(row.value("anomaly_id", std::string{}))) continue;
            const auto value = row.value("feedback_value", std::string{});
            if (value == "confirmed") {
                ++summary.confirmed;
            } else if (value == "false_positive") {
                ++summary.false_positives;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(std::format("Malformed anomaly or feedback row: {}", e.what()));
    }
    return summary;
}

size_t JsonlResultStore::run_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_->read_all().size();
}

size_t JsonlResultStore::anomaly_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return anomalies_->read_all().size();
}

} // namespace auditfusion
