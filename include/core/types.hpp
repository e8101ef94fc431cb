#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <variant>
#include <chrono>
#include <cstdint>

namespace auditfusion {

// ============================================================================
// Audit Records (externally owned, read-only to the engine)
// ============================================================================

/// Field value: null, boolean, number or text. Dates arrive as text.
using FieldValue = std::variant<std::monostate, bool, double, std::string>;

/// One audit transaction/line. Keys are field names.
using Record = std::map<std::string, FieldValue>;

[[nodiscard]] inline bool is_missing(const FieldValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

[[nodiscard]] inline bool is_numeric(const FieldValue& v) {
    return std::holds_alternative<double>(v) || std::holds_alternative<bool>(v);
}

// ============================================================================
// Basic Enums
// ============================================================================

enum class AnomalyType {
    STATISTICAL,
    PATTERN,
    BUSINESS,
    TEMPORAL,
    CONTEXTUAL
};

[[nodiscard]] inline const char* anomaly_type_to_string(AnomalyType t) {
    switch (t) {
        case AnomalyType::STATISTICAL: return "statistical";
        case AnomalyType::PATTERN:     return "pattern";
        case AnomalyType::BUSINESS:    return "business";
        case AnomalyType::TEMPORAL:    return "temporal";
        case AnomalyType::CONTEXTUAL:  return "contextual";
        default:                       return "unknown";
    }
}

[[nodiscard]] inline std::optional<AnomalyType> anomaly_type_from_string(const std::string& s) {
    if (s == "statistical") return AnomalyType::STATISTICAL;
    if (s == "pattern")     return AnomalyType::PATTERN;
    if (s == "business")    return AnomalyType::BUSINESS;
    if (s == "temporal")    return AnomalyType::TEMPORAL;
    if (s == "contextual")  return AnomalyType::CONTEXTUAL;
    return std::nullopt;
}

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

[[nodiscard]] inline const char* severity_to_string(Severity s) {
    switch (s) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
        default:                 return "unknown";
    }
}

// ============================================================================
// Detector Output
// ============================================================================

/**
 * @brief One detector's unfused verdict on one record. Lives for one run.
 */
struct AnomalyCandidate {
    std::string record_id;
    size_t record_index = 0;
    std::string detector_name;
    double raw_score = 0.0;
    double confidence = 0.0;        // [0, 1]
    AnomalyType anomaly_type = AnomalyType::STATISTICAL;
    std::string explanation;
};

enum class DetectorStatus {
    SUCCESS,
    SKIPPED,        // Model unavailable: not an error
    FAILED,         // Detector threw; contributes zero candidates
    TIMED_OUT       // Exceeded detector_timeout_ms; late result discarded
};

[[nodiscard]] inline const char* detector_status_to_string(DetectorStatus s) {
    switch (s) {
        case DetectorStatus::SUCCESS:   return "success";
        case DetectorStatus::SKIPPED:   return "skipped";
        case DetectorStatus::FAILED:    return "failed";
        case DetectorStatus::TIMED_OUT: return "timed_out";
        default:                        return "unknown";
    }
}

struct DetectorRunResult {
    std::string detector_name;
    std::string detector_type;
    DetectorStatus status = DetectorStatus::SUCCESS;
    std::vector<AnomalyCandidate> candidates;
    double execution_time_ms = 0.0;
    std::string message;            // Error cause or skip reason

    [[nodiscard]] bool skipped() const { return status == DetectorStatus::SKIPPED; }
};

// ============================================================================
// Fused Output
// ============================================================================

struct ContextSnapshot {
    std::map<std::string, double> feature_values;
    size_t feature_count = 0;
    std::chrono::system_clock::time_point detected_at;
};

/**
 * @brief Fused, externally visible anomaly. At most one per record.
 */
struct IntegratedAnomaly {
    std::string anomaly_id;
    std::string record_id;
    size_t record_index = 0;
    AnomalyType anomaly_type = AnomalyType::STATISTICAL;
    double confidence = 0.0;
    double combined_score = 0.0;
    Severity severity = Severity::LOW;
    std::set<std::string> contributing_detectors;
    std::string explanation;
    ContextSnapshot context;
};

// ============================================================================
// Run Metadata & Tuning Data (Result Store rows)
// ============================================================================

struct DetectorPerformance {
    std::string performance_id;
    std::string run_id;
    std::string detector_name;
    size_t dataset_size = 0;
    double execution_time_ms = 0.0;
    size_t candidates_found = 0;
    DetectorStatus status = DetectorStatus::SUCCESS;
    std::chrono::system_clock::time_point evaluated_at;
};

struct RunMetrics {
    double detection_time_ms = 0.0;
    double records_per_second = 0.0;
    double anomaly_rate = 0.0;
};

struct DetectionRun {
    std::string run_id;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point completed_at;
    std::vector<std::string> detectors_used;
    RunMetrics metrics;
};

struct FeatureImportance {
    std::string method;                                         // e.g. "mean_shift"
    std::vector<std::pair<std::string, double>> ranked;         // descending
};

/**
 * @brief Expert verdict on a persisted anomaly.
 *
 * feedback_type: "validation" (value "confirmed" or "false_positive") or a
 * free-form type carried through untouched.
 */
struct FeedbackEntry {
    std::string feedback_id;
    std::string anomaly_id;
    std::string feedback_type;
    std::string feedback_value;
    std::string expert_name;
    std::string comments;
    std::chrono::system_clock::time_point feedback_time;
};

struct FeedbackSummary {
    std::string detector_name;
    size_t confirmed = 0;
    size_t false_positives = 0;

    [[nodiscard]] double precision() const {
        const size_t total = confirmed + false_positives;
        return total == 0 ? 0.0 : static_cast<double>(confirmed) / static_cast<double>(total);
    }
};

} // namespace auditfusion
