#pragma once

#include "coordinator/detection_report.hpp"
#include "core/types.hpp"
#include "detectors/detector_config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace auditfusion {

// ============================================================================
// Domain rows <-> JSON (nlohmann ADL hooks)
// ============================================================================

void to_json(nlohmann::json& j, const AnomalyCandidate& c);
void to_json(nlohmann::json& j, const DetectorRunResult& r);
void to_json(nlohmann::json& j, const IntegratedAnomaly& a);
void to_json(nlohmann::json& j, const DetectorPerformance& p);
void to_json(nlohmann::json& j, const DetectionRun& r);
void to_json(nlohmann::json& j, const FeatureImportance& fi);
void to_json(nlohmann::json& j, const FeedbackEntry& f);
void to_json(nlohmann::json& j, const DetectorConfig& c);

void from_json(const nlohmann::json& j, FeedbackEntry& f);
void from_json(const nlohmann::json& j, DetectorConfig& c);

namespace codec {

/// ISO-8601 with milliseconds and UTC offset, e.g. 2024-03-01T10:15:00.123+0800
[[nodiscard]] std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

/// @throws std::invalid_argument if text is not in timestamp_to_string format
[[nodiscard]] std::chrono::system_clock::time_point timestamp_from_string(const std::string& text);

/**
 * @brief Decode inbound records.
 *
 * Accepts an array of objects, or an object mapping table name -> array of
 * objects (each record then gains a "_table" field). Tables keep the order
 * they appear in the document.
 *
 * @throws FeatureExtractionError on non-object records or nested values
 */
[[nodiscard]] std::vector<Record> records_from_json(const nlohmann::ordered_json& doc);

/// @throws FeatureExtractionError if text is not valid JSON or not a record batch
[[nodiscard]] std::vector<Record> parse_records(const std::string& text);

[[nodiscard]] nlohmann::json record_to_json(const Record& record);

/// @throws ConfigurationError on wrong field types or out-of-range values
[[nodiscard]] RunConfig run_config_from_json(const nlohmann::json& doc);

[[nodiscard]] nlohmann::json report_to_json(const DetectionReport& report);

} // namespace codec

} // namespace auditfusion
