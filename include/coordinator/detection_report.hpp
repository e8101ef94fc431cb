#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Per-call options for DetectionCoordinator::detect_anomalies().
 */
struct RunConfig {
    std::vector<std::string> detectors;         // empty = every enabled detector
    bool use_ensemble = true;                   // false = unweighted union (debug mode)
    std::optional<double> min_confidence;       // unset = engine default
    bool analyze_feature_importance = true;
    bool persist = true;
};

enum class RunStatus {
    SUCCESS,
    DEGRADED,       // a detector failed/timed out, or persistence failed
    CANCELLED,      // stop requested; nothing persisted
    ERROR           // configuration or feature extraction error; no detection
};

[[nodiscard]] inline const char* run_status_to_string(RunStatus s) {
    switch (s) {
        case RunStatus::SUCCESS:   return "success";
        case RunStatus::DEGRADED:  return "degraded";
        case RunStatus::CANCELLED: return "cancelled";
        case RunStatus::ERROR:     return "error";
        default:                   return "unknown";
    }
}

enum class PersistenceStatus {
    NOT_REQUESTED,
    PERSISTED,
    FAILED
};

[[nodiscard]] inline const char* persistence_status_to_string(PersistenceStatus s) {
    switch (s) {
        case PersistenceStatus::NOT_REQUESTED: return "not_requested";
        case PersistenceStatus::PERSISTED:     return "persisted";
        case PersistenceStatus::FAILED:        return "failed";
        default:                               return "unknown";
    }
}

/**
 * @brief Outcome of one detection run. Always carries a status; error fields
 * are set only when status is ERROR (or a persistence failure degraded it).
 */
struct DetectionReport {
    RunStatus status = RunStatus::SUCCESS;
    DetectionRun run;
    size_t total_records = 0;
    size_t anomaly_count = 0;
    std::map<std::string, DetectorRunResult> detector_results;
    std::vector<IntegratedAnomaly> anomalies;
    std::optional<FeatureImportance> feature_importance;   // top entries only
    PersistenceStatus persistence = PersistenceStatus::NOT_REQUESTED;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error_message;

    [[nodiscard]] bool ok() const {
        return status == RunStatus::SUCCESS || status == RunStatus::DEGRADED;
    }
};

} // namespace auditfusion
