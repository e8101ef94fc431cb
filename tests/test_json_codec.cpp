#include <catch2/catch_test_macros.hpp>
#include "serialization/json_codec.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <chrono>

using namespace auditfusion;

// ============================================================================
// Records
// ============================================================================

TEST_CASE("JsonCodec: records from an array", "[json]") {
    const auto records = codec::parse_records(R"([
        {"id": 1, "amount": 12.5, "posted": true, "memo": "rent", "ref": null},
        {"id": 2, "amount": -3}
    ])");
    REQUIRE(records.size() == 2);
    CHECK(std::get<double>(records[0].at("amount")) == 12.5);
    CHECK(std::get<bool>(records[0].at("posted")));
    CHECK(std::get<std::string>(records[0].at("memo")) == "rent");
    CHECK(is_missing(records[0].at("ref")));
    CHECK_FALSE(records[1].contains("_table"));
}

TEST_CASE("JsonCodec: records from a table map carry the table name", "[json]") {
    const auto records = codec::parse_records(R"({
        "ledger": [{"id": "L1", "amount": 1}],
        "vouchers": [{"id": "V1", "amount": 2}, {"id": "V2", "amount": 3}]
    })");
    REQUIRE(records.size() == 3);
    CHECK(std::get<std::string>(records[0].at("_table")) == "ledger");
    CHECK(std::get<std::string>(records[2].at("_table")) == "vouchers");
}

TEST_CASE("JsonCodec: tables keep document order", "[json]") {
    const auto records = codec::parse_records(R"({
        "vouchers": [{"id": "V1", "amount": 2}],
        "ledger": [{"id": "L1", "amount": 1}, {"id": "L2", "amount": 3}]
    })");
    REQUIRE(records.size() == 3);
    CHECK(std::get<std::string>(records[0].at("_table")) == "vouchers");
    CHECK(std::get<std::string>(records[1].at("id")) == "L1");
    CHECK(std::get<std::string>(records[2].at("_table")) == "ledger");
}

TEST_CASE("JsonCodec: malformed batches are feature extraction errors", "[json]") {
    CHECK_THROWS_AS(codec::parse_records("{not json"), FeatureExtractionError);
    CHECK_THROWS_AS(codec::parse_records("42"), FeatureExtractionError);
    CHECK_THROWS_AS(codec::parse_records(R"([1, 2])"), FeatureExtractionError);
    CHECK_THROWS_AS(codec::parse_records(R"([{"id": 1, "nested": {"a": 1}}])"), FeatureExtractionError);
    CHECK_THROWS_AS(codec::parse_records(R"({"ledger": {"id": 1}})"), FeatureExtractionError);
}

TEST_CASE("JsonCodec: record_to_json restores field kinds", "[json]") {
    Record r = {{"a", 1.5}, {"b", std::string("x")}, {"c", std::monostate{}}, {"d", true}};
    const auto j = codec::record_to_json(r);
    CHECK(j["a"] == 1.5);
    CHECK(j["b"] == "x");
    CHECK(j["c"].is_null());
    CHECK(j["d"] == true);
}

// ============================================================================
// Run config
// ============================================================================

TEST_CASE("JsonCodec: run config", "[json]") {
    const auto rc = codec::run_config_from_json(nlohmann::json::parse(R"({
        "detectors": ["audit_rules", "dbscan"],
        "use_ensemble": false,
        "min_confidence": 0.4,
        "persist": false
    })"));
    CHECK(rc.detectors == std::vector<std::string>{"audit_rules", "dbscan"});
    CHECK_FALSE(rc.use_ensemble);
    REQUIRE(rc.min_confidence.has_value());
    CHECK(*rc.min_confidence == 0.4);
    CHECK(rc.analyze_feature_importance);
    CHECK_FALSE(rc.persist);

    const auto defaults = codec::run_config_from_json(nlohmann::json::object());
    CHECK(defaults.detectors.empty());
    CHECK(defaults.use_ensemble);
    CHECK_FALSE(defaults.min_confidence.has_value());
}

TEST_CASE("JsonCodec: invalid run config", "[json]") {
    CHECK_THROWS_AS(codec::run_config_from_json(nlohmann::json::array()), ConfigurationError);
    CHECK_THROWS_AS(codec::run_config_from_json({{"detectors", "dbscan"}}), ConfigurationError);
    CHECK_THROWS_AS(codec::run_config_from_json({{"use_ensemble", "yes"}}), ConfigurationError);
    CHECK_THROWS_AS(codec::run_config_from_json({{"min_confidence", 1.5}}), ConfigurationError);
}

// ============================================================================
// Rows and report
// ============================================================================

TEST_CASE("JsonCodec: timestamps keep millisecond precision", "[json]") {
    const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto text = codec::timestamp_to_string(now);
    CHECK(codec::timestamp_from_string(text) == now);
    CHECK_THROWS_AS(codec::timestamp_from_string("yesterday"), std::invalid_argument);
}

TEST_CASE("JsonCodec: detector config and feedback round trip", "[json]") {
    DetectorConfig cfg;
    cfg.name = "dbscan_wide";
    cfg.type = "dbscan";
    cfg.weight = 0.7;
    cfg.params = {{"eps", 1.5}};

    const nlohmann::json j = cfg;
    const auto back = j.get<DetectorConfig>();
    CHECK(back.name == cfg.name);
    CHECK(back.type == cfg.type);
    CHECK(back.weight == cfg.weight);
    CHECK(back.params == cfg.params);

    FeedbackEntry fb;
    fb.feedback_id = "f1";
    fb.anomaly_id = "a1";
    fb.feedback_type = "validation";
    fb.feedback_value = "confirmed";
    fb.expert_name = "auditor";
    fb.feedback_time = std::chrono::time_point_cast<std::chrono::milliseconds>(utils::now());
    const auto fb_back = nlohmann::json(fb).get<FeedbackEntry>();
    CHECK(fb_back.anomaly_id == "a1");
    CHECK(fb_back.feedback_value == "confirmed");
    CHECK(fb_back.feedback_time == fb.feedback_time);
}

TEST_CASE("JsonCodec: report document shape", "[json]") {
    DetectionReport report;
    report.status = RunStatus::DEGRADED;
    report.run.run_id = "run-1";
    report.total_records = 3;

    IntegratedAnomaly a;
    a.anomaly_id = "a1";
    a.record_id = "r1";
    a.confidence = 0.92;
    a.severity = Severity::CRITICAL;
    a.anomaly_type = AnomalyType::BUSINESS;
    a.contributing_detectors = {"audit_rules"};
    a.context.feature_values = {{"amount", 15000000.0}};
    report.anomalies.push_back(a);
    report.anomaly_count = 1;

    DetectorRunResult skipped;
    skipped.detector_name = "supervised_classifier";
    skipped.status = DetectorStatus::SKIPPED;
    report.detector_results["supervised_classifier"] = skipped;
    report.persistence = PersistenceStatus::FAILED;
    report.error_category = ErrorCategory::PERSISTENCE_ERROR;
    report.error_message = "disk full";

    const auto j = codec::report_to_json(report);
    CHECK(j["status"] == "degraded");
    CHECK(j["run"]["run_id"] == "run-1");
    CHECK(j["anomaly_count"] == 1);
    CHECK(j["anomalies"][0]["severity"] == "critical");
    CHECK(j["anomalies"][0]["anomaly_type"] == "business");
    CHECK(j["anomalies"][0]["contributing_detectors"][0] == "audit_rules");
    CHECK(j["anomalies"][0]["context"]["feature_values"]["amount"] == 15000000.0);
    CHECK(j["detector_results"]["supervised_classifier"]["skipped"] == true);
    CHECK(j["persistence_status"] == "failed");
    CHECK(j["feature_importance"].is_null());
    CHECK(j["error"]["category"] == "persistence_error");
}
