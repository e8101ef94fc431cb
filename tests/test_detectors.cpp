#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "detectors/density_cluster_detector.hpp"
#include "detectors/detector_factory.hpp"
#include "detectors/outlier_ensemble_detector.hpp"
#include "detectors/reconstruction_detector.hpp"
#include "detectors/rule_heuristic_detector.hpp"
#include "detectors/supervised_classifier_detector.hpp"
#include "features/feature_builder.hpp"
#include "models/tree_ensemble_classifier.hpp"
#include "core/error.hpp"

#include <algorithm>

using namespace auditfusion;
using Catch::Approx;

namespace {

DetectorConfig make_config(const std::string& type, nlohmann::json params = nlohmann::json::object()) {
    DetectorConfig cfg;
    cfg.name = type;
    cfg.type = type;
    cfg.params = std::move(params);
    return cfg;
}

// 40 ordinary ledger lines plus one extreme amount (id "big")
std::vector<Record> ledger_with_spike() {
    std::vector<Record> records;
    for (int i = 0; i < 40; ++i) {
        records.push_back({{"id", static_cast<double>(i)},
                           {"amount", 1000.0 + (i % 10) * 10.0},
                           {"account", std::string(i % 2 ? "cash" : "bank")}});
    }
    records.push_back({{"id", std::string("big")}, {"amount", 5000000.0},
                       {"account", std::string("cash")}});
    return records;
}

bool flagged(const std::vector<AnomalyCandidate>& candidates, const std::string& id) {
    return std::any_of(candidates.begin(), candidates.end(),
        [&](const AnomalyCandidate& c) { return c.record_id == id; });
}

} // namespace

// ============================================================================
// Rule heuristics
// ============================================================================

TEST_CASE("RuleHeuristic: zero, negative and oversized amounts", "[detectors][rules]") {
    const std::vector<Record> records = {
        {{"id", std::string("ok")}, {"amount", 120.0}, {"account", std::string("cash")}},
        {{"id", std::string("zero")}, {"amount", 0.0}, {"account", std::string("cash")}},
        {{"id", std::string("neg")}, {"amount", -50.0}, {"account", std::string("accounts_receivable")}},
        {{"id", std::string("neg_cash")}, {"amount", -50.0}, {"account", std::string("cash")}},
        {{"id", std::string("huge")}, {"amount", 2.0e7}, {"account", std::string("cash")}},
        {{"id", std::string("missing")}, {"account", std::string("cash")}},
    };
    const auto batch = FeatureBuilder().build(records);
    const auto cfg = make_config("audit_rules");
    RuleHeuristicDetector detector(cfg);

    const auto candidates = detector.detect(batch, DetectionContext{cfg, nullptr, {}, 0.1});
    CHECK(flagged(candidates, "zero"));
    CHECK(flagged(candidates, "neg"));
    CHECK(flagged(candidates, "huge"));
    CHECK_FALSE(flagged(candidates, "ok"));
    CHECK_FALSE(flagged(candidates, "neg_cash"));
    // Imputed amounts never trigger rules
    CHECK_FALSE(flagged(candidates, "missing"));

    for (const auto& c : candidates) {
        CHECK(c.anomaly_type == AnomalyType::BUSINESS);
        CHECK(c.confidence == Approx(0.9));
        CHECK(c.explanation.find("audit rule violation") != std::string::npos);
    }
}

TEST_CASE("RuleHeuristic: amount column with mixed value types", "[detectors][rules]") {
    const std::vector<Record> records = {
        {{"id", 1.0}, {"amount", 0.0}},
        {{"id", 2.0}, {"amount", 500.0}},
        {{"id", 3.0}, {"amount", std::string("1,200.00")}},
        {{"id", 4.0}, {"amount", std::string("20,000,000")}},
        {{"id", 5.0}, {"amount", std::string("0.00")}},
        {{"id", 6.0}, {"amount", std::string("n/a")}},
    };
    const auto batch = FeatureBuilder().build(records);
    REQUIRE(batch.vectors.size() == 6);
    CHECK(batch.vectors[2].amounts.at("amount") == Approx(1200.0));
    CHECK_FALSE(batch.vectors[5].amounts.contains("amount"));

    const auto cfg = make_config("audit_rules");
    RuleHeuristicDetector detector(cfg);
    const auto candidates = detector.detect(batch, DetectionContext{cfg, nullptr, {}, 0.1});

    CHECK(flagged(candidates, "1"));
    CHECK(flagged(candidates, "4"));
    CHECK(flagged(candidates, "5"));
    CHECK_FALSE(flagged(candidates, "2"));
    CHECK_FALSE(flagged(candidates, "3"));
    CHECK_FALSE(flagged(candidates, "6"));
}

TEST_CASE("RuleHeuristic: every zero-amount record is flagged", "[detectors][rules]") {
    std::vector<Record> records;
    for (int i = 0; i < 30; ++i) {
        records.push_back({{"id", static_cast<double>(i)}, {"amount", (i % 3 == 0) ? 0.0 : 10.0 * i}});
    }
    const auto batch = FeatureBuilder().build(records);
    const auto cfg = make_config("audit_rules");
    const auto candidates = RuleHeuristicDetector(cfg).detect(batch, DetectionContext{cfg, nullptr, {}, 0.1});

    for (int i = 0; i < 30; i += 3) {
        CHECK(flagged(candidates, std::to_string(i)));
    }
    CHECK(candidates.size() == 10);
}

TEST_CASE("RuleHeuristic: invalid params", "[detectors][rules]") {
    CHECK_THROWS_AS(RuleHeuristicDetector(make_config("audit_rules", {{"amount_ceiling", 0.0}})),
                    ConfigurationError);
    CHECK_THROWS_AS(RuleHeuristicDetector(make_config("audit_rules", {{"never_negative_patterns", "x"}})),
                    ConfigurationError);
}

// ============================================================================
// Density clustering
// ============================================================================

TEST_CASE("DensityCluster: isolated point is noise, border points are not", "[detectors][dbscan]") {
    const std::vector<std::vector<double>> points = {
        {0.0, 0.0}, {0.1, 0.0}, {0.0, 0.1}, {0.1, 0.1},   // dense core
        {0.5, 0.0},                                       // border: near one core point only
        {5.0, 5.0},                                       // isolated
    };
    const auto noise = DensityClusterDetector::noise_points(points, 0.45, 4, {});
    REQUIRE(noise.size() == points.size());
    CHECK_FALSE(noise[0]);
    CHECK_FALSE(noise[4]);
    CHECK(noise[5]);
}

TEST_CASE("DensityCluster: flags the spike with baseline confidence", "[detectors][dbscan]") {
    const auto batch = FeatureBuilder().build(ledger_with_spike());
    const auto cfg = make_config("dbscan", {{"eps", 0.5}, {"min_samples", 3}, {"baseline_confidence", 0.75}});
    const auto candidates = DensityClusterDetector(cfg).detect(batch, DetectionContext{cfg, nullptr, {}, 0.1});

    REQUIRE(flagged(candidates, "big"));
    for (const auto& c : candidates) {
        CHECK(c.confidence == Approx(0.75));
        CHECK(c.anomaly_type == AnomalyType::PATTERN);
    }
}

TEST_CASE("DensityCluster: invalid params", "[detectors][dbscan]") {
    CHECK_THROWS_AS(DensityClusterDetector(make_config("dbscan", {{"eps", 0.0}})), ConfigurationError);
    CHECK_THROWS_AS(DensityClusterDetector(make_config("dbscan", {{"min_samples", 0}})), ConfigurationError);
}

// ============================================================================
// Isolation forest
// ============================================================================

TEST_CASE("OutlierEnsemble: flags the spike", "[detectors][isolation_forest]") {
    const auto batch = FeatureBuilder().build(ledger_with_spike());
    const auto cfg = make_config("isolation_forest", {{"n_estimators", 50}, {"seed", 3}});
    const auto candidates = OutlierEnsembleDetector(cfg).detect(batch, DetectionContext{cfg, nullptr, {}, 0.05});

    REQUIRE(flagged(candidates, "big"));
    for (const auto& c : candidates) {
        CHECK(c.confidence > 0.5);
        CHECK(c.confidence <= 1.0);
        CHECK(c.anomaly_type == AnomalyType::STATISTICAL);
    }
}

TEST_CASE("OutlierEnsemble: invalid params", "[detectors][isolation_forest]") {
    CHECK_THROWS_AS(OutlierEnsembleDetector(make_config("isolation_forest", {{"n_estimators", 0}})),
                    ConfigurationError);
    CHECK_THROWS_AS(OutlierEnsembleDetector(make_config("isolation_forest", {{"contamination", 0.9}})),
                    ConfigurationError);
}

// ============================================================================
// Reconstruction error
// ============================================================================

TEST_CASE("Reconstruction: fits on the batch and flags the contamination tail", "[detectors][autoencoder]") {
    const auto batch = FeatureBuilder().build(ledger_with_spike());
    const auto cfg = make_config("autoencoder", {{"contamination", 0.05}});
    const auto candidates = ReconstructionDetector(cfg).detect(batch, DetectionContext{cfg, nullptr, {}, 0.1});

    CHECK(candidates.size() <= 3);
    for (const auto& c : candidates) {
        CHECK(c.confidence > 0.0);
        CHECK(c.confidence <= 1.0);
        CHECK(c.anomaly_type == AnomalyType::PATTERN);
    }
}

TEST_CASE("Reconstruction: without batch fitting a model is required", "[detectors][autoencoder]") {
    const auto batch = FeatureBuilder().build(ledger_with_spike());
    const auto cfg = make_config("autoencoder", {{"fit_on_batch", false}});
    ReconstructionDetector detector(cfg);
    CHECK_THROWS_AS(detector.detect(batch, DetectionContext{cfg, nullptr, {}, 0.1}), ModelUnavailableError);
}

// ============================================================================
// Supervised classifier
// ============================================================================

TEST_CASE("SupervisedClassifier: skipped without a model", "[detectors][classifier]") {
    const auto batch = FeatureBuilder().build(ledger_with_spike());
    auto cfg = make_config("supervised_classifier");
    cfg.threshold = 0.7;
    SupervisedClassifierDetector detector(cfg);
    CHECK(detector.requires_fitted_model());
    CHECK_THROWS_AS(detector.detect(batch, DetectionContext{cfg, nullptr, {}, 0.1}), ModelUnavailableError);
}

TEST_CASE("SupervisedClassifier: flags probabilities above threshold", "[detectors][classifier]") {
    const auto batch = FeatureBuilder().build(ledger_with_spike());
    auto cfg = make_config("supervised_classifier");
    cfg.threshold = 0.7;

    std::shared_ptr<const IModel> model = TreeEnsembleClassifier::from_json(nlohmann::json::parse(R"({
        "trees": [ { "nodes": [
            { "feature": "amount", "threshold": 100000.0, "left": 1, "right": 2 },
            { "leaf": -3.0 },
            { "leaf": 3.0 } ] } ]
    })"));

    const auto candidates = SupervisedClassifierDetector(cfg).detect(
        batch, DetectionContext{cfg, model, {}, 0.1});
    REQUIRE(candidates.size() == 1);
    CHECK(candidates[0].record_id == "big");
    CHECK(candidates[0].confidence > 0.7);
    CHECK(candidates[0].anomaly_type == AnomalyType::BUSINESS);
}

TEST_CASE("SupervisedClassifier: threshold must be a probability", "[detectors][classifier]") {
    auto cfg = make_config("supervised_classifier");
    cfg.threshold = 1.5;
    CHECK_THROWS_AS(SupervisedClassifierDetector(cfg), ConfigurationError);
}

// ============================================================================
// Factory
// ============================================================================

TEST_CASE("DetectorFactory: built-in types and unknown type", "[detectors][factory]") {
    auto& factory = DetectorFactory::instance();
    for (const auto* type : {"isolation_forest", "dbscan", "supervised_classifier", "autoencoder", "audit_rules"}) {
        CHECK(factory.has_type(type));
        const auto detector = factory.create(make_config(type));
        REQUIRE(detector);
        CHECK(detector->type() == type);
        CHECK(detector->name() == type);
    }
    CHECK_FALSE(factory.has_type("one_class_svm"));
    CHECK_THROWS_AS(factory.create(make_config("one_class_svm")), ConfigurationError);
}

TEST_CASE("DetectorFactory: ill-typed params become configuration errors", "[detectors][factory]") {
    CHECK_THROWS_AS(DetectorFactory::instance().create(make_config("dbscan", {{"eps", "wide"}})),
                    ConfigurationError);
}
