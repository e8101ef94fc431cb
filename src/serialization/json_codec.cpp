#include "serialization/json_codec.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <cstdio>
#include <format>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace auditfusion {

// ============================================================================
// ADL hooks
// ============================================================================

void to_json(nlohmann::json& j, const AnomalyCandidate& c) {
    j = {
        {"record_id", c.record_id},
        {"record_index", c.record_index},
        {"detector_name", c.detector_name},
        {"raw_score", c.raw_score},
        {"confidence", c.confidence},
        {"anomaly_type", anomaly_type_to_string(c.anomaly_type)},
        {"explanation", c.explanation}
    };
}

void to_json(nlohmann::json& j, const DetectorRunResult& r) {
    j = {
        {"detector_name", r.detector_name},
        {"detector_type", r.detector_type},
        {"status", detector_status_to_string(r.status)},
        {"skipped", r.skipped()},
        {"candidate_count", r.candidates.size()},
        {"execution_time_ms", r.execution_time_ms},
        {"message", r.message},
        {"candidates", r.candidates}
    };
}

void to_json(nlohmann::json& j, const IntegratedAnomaly& a) {
    j = {
        {"anomaly_id", a.anomaly_id},
        {"record_id", a.record_id},
        {"record_index", a.record_index},
        {"anomaly_type", anomaly_type_to_string(a.anomaly_type)},
        {"confidence", a.confidence},
        {"combined_score", a.combined_score},
        {"severity", severity_to_string(a.severity)},
        {"contributing_detectors", a.contributing_detectors},
        {"explanation", a.explanation},
        {"context", {
            {"feature_values", a.context.feature_values},
            {"feature_count", a.context.feature_count},
            {"detected_at", codec::timestamp_to_string(a.context.detected_at)}
        }}
    };
}

void to_json(nlohmann::json& j, const DetectorPerformance& p) {
    j = {
        {"performance_id", p.performance_id},
        {"run_id", p.run_id},
        {"detector_name", p.detector_name},
        {"dataset_size", p.dataset_size},
        {"execution_time_ms", p.execution_time_ms},
        {"candidates_found", p.candidates_found},
        {"status", detector_status_to_string(p.status)},
        {"evaluated_at", codec::timestamp_to_string(p.evaluated_at)}
    };
}

void to_json(nlohmann::json& j, const DetectionRun& r) {
    j = {
        {"run_id", r.run_id},
        {"started_at", codec::timestamp_to_string(r.started_at)},
        {"completed_at", codec::timestamp_to_string(r.completed_at)},
        {"detectors_used", r.detectors_used},
        {"metrics", {
            {"detection_time_ms", r.metrics.detection_time_ms},
            {"records_per_second", r.metrics.records_per_second},
            {"anomaly_rate", r.metrics.anomaly_rate}
        }}
    };
}

void to_json(nlohmann::json& j, const FeatureImportance& fi) {
    nlohmann::json ranked = nlohmann::json::array();
    for (const auto& [feature, score] : fi.ranked) {
        ranked.push_back({{"feature", feature}, {"importance", score}});
    }
    j = {{"method", fi.method}, {"ranked", std::move(ranked)}};
}

void to_json(nlohmann::json& j, const FeedbackEntry& f) {
    j = {
        {"feedback_id", f.feedback_id},
        {"anomaly_id", f.anomaly_id},
        {"feedback_type", f.feedback_type},
        {"feedback_value", f.feedback_value},
        {"expert_name", f.expert_name},
        {"comments", f.comments},
        {"feedback_time", codec::timestamp_to_string(f.feedback_time)}
    };
}

void from_json(const nlohmann::json& j, FeedbackEntry& f) {
    f.feedback_id = j.at("feedback_id").get<std::string>();
    f.anomaly_id = j.at("anomaly_id").get<std::string>();
    f.feedback_type = j.at("feedback_type").get<std::string>();
    f.feedback_value = j.value("feedback_value", std::string{});
    f.expert_name = j.value("expert_name", std::string{});
    f.comments = j.value("comments", std::string{});
    f.feedback_time = codec::timestamp_from_string(j.at("feedback_time").get<std::string>());
}

void to_json(nlohmann::json& j, const DetectorConfig& c) {
    j = {
        {"name", c.name},
        {"type", c.type},
        {"enabled", c.enabled},
        {"weight", c.weight},
        {"threshold", c.threshold},
        {"params", c.params}
    };
}

void from_json(const nlohmann::json& j, DetectorConfig& c) {
    c.name = j.at("name").get<std::string>();
    c.type = j.at("type").get<std::string>();
    c.enabled = j.value("enabled", true);
    c.weight = j.value("weight", 1.0);
    c.threshold = j.value("threshold", 0.5);
    c.params = j.value("params", nlohmann::json::object());
}

namespace codec {

// ============================================================================
// Timestamps
// ============================================================================

std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp) {
    return utils::format_timestamp(tp);
}

std::chrono::system_clock::time_point timestamp_from_string(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0, ms = 0, tz_h = 0, tz_m = 0;
    char sign = '+';
    const int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d%c%2d%2d",
                              &y, &mo, &d, &h, &mi, &s, &ms, &sign, &tz_h, &tz_m);
    if (n < 6) {
        throw std::invalid_argument("invalid timestamp: " + text);
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mo)},
        std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        throw std::invalid_argument("invalid timestamp date: " + text);
    }

    auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{h} + std::chrono::minutes{mi} +
              std::chrono::seconds{s} + std::chrono::milliseconds{ms};
    if (n == 10) {
        const auto offset = std::chrono::hours{tz_h} + std::chrono::minutes{tz_m};
        tp = (sign == '-') ? tp + offset : tp - offset;
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
}

// ============================================================================
// Inbound records
// ============================================================================

namespace {

FieldValue field_from_json(const nlohmann::ordered_json& v, const std::string& field, size_t index) {
    if (v.is_null()) return std::monostate{};
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return v.get<std::string>();
    throw FeatureExtractionError(
        std::format("record {} field '{}': nested values are not supported", index, field));
}

void append_records(const nlohmann::ordered_json& arr, const std::string* table,
                    std::vector<Record>& out) {
    for (const auto& item : arr) {
        const size_t index = out.size();
        if (!item.is_object()) {
            throw FeatureExtractionError(std::format("record {} is not an object", index));
        }
        Record record;
        for (const auto& [key, value] : item.items()) {
            record[key] = field_from_json(value, key, index);
        }
        if (table) record["_table"] = *table;
        out.push_back(std::move(record));
    }
}

} // anonymous namespace

std::vector<Record> records_from_json(const nlohmann::ordered_json& doc) {
    std::vector<Record> records;
    if (doc.is_array()) {
        append_records(doc, nullptr, records);
        return records;
    }
    if (doc.is_object()) {
        // Tables are concatenated in document order
        for (const auto& [table, arr] : doc.items()) {
            if (!arr.is_array()) {
                throw FeatureExtractionError(
                    std::format("table '{}' must map to an array of records", table));
            }
            append_records(arr, &table, records);
        }
        return records;
    }
    throw FeatureExtractionError("record batch must be an array or an object of tables");
}

std::vector<Record> parse_records(const std::string& text) {
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw FeatureExtractionError(std::format("record batch is not valid JSON: {}", e.what()));
    }
    return records_from_json(doc);
}

nlohmann::json record_to_json(const Record& record) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : record) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                j[key] = nullptr;
            } else {
                j[key] = v;
            }
        }, value);
    }
    return j;
}

// ============================================================================
// Run config
// ============================================================================

RunConfig run_config_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigurationError("run config must be a JSON object");
    }

    RunConfig rc;
    if (const auto it = doc.find("detectors"); it != doc.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw ConfigurationError("run config 'detectors' must be an array of names");
        }
        for (const auto& name : *it) {
            if (!name.is_string()) {
                throw ConfigurationError("run config 'detectors' must be an array of names");
            }
            rc.detectors.push_back(name.get<std::string>());
        }
    }

    auto read_bool = [&](const char* key, bool& out) {
        const auto it = doc.find(key);
        if (it == doc.end() || it->is_null()) return;
        if (!it->is_boolean()) {
            throw ConfigurationError(std::format("run config '{}' must be a boolean", key));
        }
        out = it->get<bool>();
    };
    read_bool("use_ensemble", rc.use_ensemble);
    read_bool("analyze_feature_importance", rc.analyze_feature_importance);
    read_bool("persist", rc.persist);

    if (const auto it = doc.find("min_confidence"); it != doc.end() && !it->is_null()) {
        if (!it->is_number()) {
            throw ConfigurationError("run config 'min_confidence' must be a number");
        }
        const double v = it->get<double>();
        if (!(v >= 0.0 && v <= 1.0)) {
            throw ConfigurationError("run config 'min_confidence' must be in [0, 1]");
        }
        rc.min_confidence = v;
    }
    return rc;
}

// ============================================================================
// Report
// ============================================================================

nlohmann::json report_to_json(const DetectionReport& report) {
    nlohmann::json detectors = nlohmann::json::object();
    for (const auto& [name, result] : report.detector_results) {
        detectors[name] = result;
    }

    nlohmann::json j = {
        {"status", run_status_to_string(report.status)},
        {"run", report.run},
        {"total_records", report.total_records},
        {"anomaly_count", report.anomaly_count},
        {"detector_results", std::move(detectors)},
        {"anomalies", report.anomalies},
        {"metrics", {
            {"detection_time_ms", report.run.metrics.detection_time_ms},
            {"records_per_second", report.run.metrics.records_per_second},
            {"anomaly_rate", report.run.metrics.anomaly_rate}
        }},
        {"persistence_status", persistence_status_to_string(report.persistence)}
    };

    j["feature_importance"] = report.feature_importance
        ? nlohmann::json(*report.feature_importance) : nlohmann::json(nullptr);

    if (report.error_category != ErrorCategory::NONE) {
        j["error"] = {
            {"category", error_category_to_string(report.error_category)},
            {"message", report.error_message}
        };
    } else {
        j["error"] = nullptr;
    }
    return j;
}

} // namespace codec

} // namespace auditfusion
