#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "fusion/fusion_engine.hpp"

#include <algorithm>
#include <cmath>

using namespace auditfusion;
using Catch::Approx;

namespace {

AnomalyCandidate candidate(const std::string& record, const std::string& detector,
                           double confidence, AnomalyType type = AnomalyType::STATISTICAL,
                           double score = -1.0) {
    AnomalyCandidate c;
    c.record_id = record;
    c.detector_name = detector;
    c.confidence = confidence;
    c.raw_score = score < 0.0 ? confidence : score;
    c.anomaly_type = type;
    c.explanation = detector + " hit";
    return c;
}

} // namespace

// ============================================================================
// Severity
// ============================================================================

TEST_CASE("Severity: thresholds are inclusive", "[fusion][severity]") {
    SeverityPolicy policy;
    CHECK(policy.classify(0.9, 0.0) == Severity::CRITICAL);
    CHECK(policy.classify(0.89, 0.0) == Severity::HIGH);
    CHECK(policy.classify(0.8, 0.0) == Severity::HIGH);
    CHECK(policy.classify(0.7, 0.0) == Severity::MEDIUM);
    CHECK(policy.classify(0.5, 0.5) == Severity::LOW);
    // Score alone can escalate
    CHECK(policy.classify(0.1, 3.0) == Severity::CRITICAL);
    CHECK(policy.classify(0.1, 2.0) == Severity::HIGH);
    CHECK(policy.classify(0.1, 1.0) == Severity::MEDIUM);
}

TEST_CASE("Severity: validation", "[fusion][severity]") {
    SeverityPolicy policy;
    CHECK(policy.validate().empty());

    policy.high_confidence = 0.95;
    CHECK_FALSE(policy.validate().empty());

    SeverityPolicy out_of_range;
    out_of_range.critical_confidence = 1.5;
    CHECK_FALSE(out_of_range.validate().empty());
}

// ============================================================================
// Weighted fusion
// ============================================================================

TEST_CASE("Fusion: weighted confidence and score", "[fusion]") {
    FusionEngine engine;
    const std::vector<AnomalyCandidate> candidates = {
        candidate("r1", "a", 0.9, AnomalyType::STATISTICAL, 2.0),
        candidate("r1", "b", 0.6, AnomalyType::STATISTICAL, 1.0),
    };
    const std::map<std::string, double> weights = {{"a", 3.0}, {"b", 1.0}};

    const auto fused = engine.fuse(candidates, weights, {}, 0.0);
    REQUIRE(fused.size() == 1);
    CHECK(fused[0].confidence == Approx((0.9 * 3.0 + 0.6) / 4.0));
    CHECK(fused[0].combined_score == Approx((2.0 * 3.0 + 1.0) / 4.0));
    CHECK(fused[0].contributing_detectors == std::set<std::string>{"a", "b"});
    CHECK(fused[0].explanation.find("flagged by 2 detectors (a, b)") == 0);
    CHECK_FALSE(fused[0].anomaly_id.empty());
}

TEST_CASE("Fusion: min_confidence filters groups", "[fusion]") {
    FusionEngine engine;
    const std::vector<AnomalyCandidate> candidates = {
        candidate("r1", "a", 0.95),
        candidate("r2", "a", 0.5),
    };
    const auto fused = engine.fuse(candidates, {{"a", 1.0}}, {});
    REQUIRE(fused.size() == 1);
    CHECK(fused[0].record_id == "r1");

    CHECK(engine.fuse(candidates, {{"a", 1.0}}, {}, 0.4).size() == 2);
}

TEST_CASE("Fusion: single candidate at 0.9 is critical", "[fusion]") {
    FusionEngine engine;
    const auto fused = engine.fuse({candidate("r1", "rules", 0.9, AnomalyType::BUSINESS, 1.0)},
                                   {{"rules", 1.0}}, {});
    REQUIRE(fused.size() == 1);
    CHECK(fused[0].confidence == Approx(0.9));
    CHECK(fused[0].severity == Severity::CRITICAL);
    CHECK(fused[0].explanation.find("flagged by 1 detector (rules)") == 0);
}

TEST_CASE("Fusion: at most one anomaly per record, one vote per detector", "[fusion]") {
    FusionEngine engine;
    const std::vector<AnomalyCandidate> candidates = {
        candidate("r1", "a", 0.8),
        candidate("r1", "a", 1.0),      // duplicate from same detector: best one counts
        candidate("r1", "b", 0.8),
    };
    const auto fused = engine.fuse(candidates, {{"a", 1.0}, {"b", 1.0}}, {}, 0.0);
    REQUIRE(fused.size() == 1);
    CHECK(fused[0].confidence == Approx(0.9));
    CHECK(fused[0].contributing_detectors.size() == 2);
}

TEST_CASE("Fusion: zero total weight drops the group", "[fusion]") {
    FusionEngine engine;
    const auto fused = engine.fuse({candidate("r1", "muted", 1.0)}, {{"muted", 0.0}}, {}, 0.0);
    CHECK(fused.empty());
}

TEST_CASE("Fusion: unlisted detectors use the default weight", "[fusion]") {
    FusionEngine::Config cfg;
    cfg.default_weight = 1.0;
    FusionEngine engine(cfg);
    const auto fused = engine.fuse({candidate("r1", "a", 1.0), candidate("r1", "x", 0.5)},
                                   {{"a", 1.0}}, {}, 0.0);
    REQUIRE(fused.size() == 1);
    CHECK(fused[0].confidence == Approx(0.75));
}

TEST_CASE("Fusion: confidence is clamped and bounded", "[fusion]") {
    FusionEngine engine;
    const auto fused = engine.fuse({candidate("r1", "a", 1.7), candidate("r1", "b", -0.3)},
                                   {{"a", 1.0}, {"b", 1.0}}, {}, 0.0);
    REQUIRE(fused.size() == 1);
    CHECK(fused[0].confidence >= 0.0);
    CHECK(fused[0].confidence <= 1.0);
    CHECK(fused[0].confidence == Approx(0.5));
}

TEST_CASE("Fusion: adding a more confident detector never lowers confidence", "[fusion]") {
    FusionEngine engine;
    const std::map<std::string, double> weights = {{"a", 0.3}, {"b", 0.4}, {"c", 1.0}};
    const std::vector<AnomalyCandidate> base = {candidate("r1", "a", 0.7), candidate("r1", "b", 0.8)};
    auto more = base;
    more.push_back(candidate("r1", "c", 0.95));

    const auto before = engine.fuse(base, weights, {}, 0.0);
    const auto after = engine.fuse(more, weights, {}, 0.0);
    REQUIRE(before.size() == 1);
    REQUIRE(after.size() == 1);
    CHECK(after[0].confidence >= before[0].confidence);
}

TEST_CASE("Fusion: raising a detector's weight pulls confidence toward it", "[fusion]") {
    FusionEngine engine;
    const std::vector<double> weights_c = {0.1, 1.0, 10.0};

    const auto distances = [&](double c_confidence) {
        std::vector<double> result;
        for (const double w : weights_c) {
            const std::map<std::string, double> weights = {{"a", 1.0}, {"b", 1.0}, {"c", w}};
            const auto fused = engine.fuse({candidate("r1", "a", 0.8),
                                            candidate("r1", "b", 0.9),
                                            candidate("r1", "c", c_confidence)},
                                           weights, {}, 0.0);
            REQUIRE(fused.size() == 1);
            result.push_back(std::abs(fused[0].confidence - c_confidence));
        }
        return result;
    };

    SECTION("detector above the others") {
        const auto d = distances(0.95);
        CHECK(d[1] <= d[0]);
        CHECK(d[2] <= d[1]);
    }
    SECTION("detector below the others") {
        const auto d = distances(0.2);
        CHECK(d[1] <= d[0]);
        CHECK(d[2] <= d[1]);
        CHECK(d[2] < 0.15);
    }
}

TEST_CASE("Fusion: deterministic ranking and results", "[fusion]") {
    FusionEngine engine;
    const std::vector<AnomalyCandidate> candidates = {
        candidate("r3", "a", 0.8), candidate("r1", "a", 0.95),
        candidate("r2", "a", 0.8), candidate("r2", "b", 0.8),
    };
    const std::map<std::string, double> weights = {{"a", 1.0}, {"b", 1.0}};

    const auto first = engine.fuse(candidates, weights, {}, 0.0);
    REQUIRE(first.size() == 3);
    CHECK(first[0].record_id == "r1");
    // Equal confidence: record_id ascending
    CHECK(first[1].record_id == "r2");
    CHECK(first[2].record_id == "r3");

    auto reversed = candidates;
    std::reverse(reversed.begin(), reversed.end());
    const auto second = engine.fuse(reversed, weights, {}, 0.0);
    REQUIRE(second.size() == first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        CHECK(second[i].record_id == first[i].record_id);
        CHECK(second[i].confidence == first[i].confidence);
        CHECK(second[i].combined_score == first[i].combined_score);
        CHECK(second[i].explanation == first[i].explanation);
    }
}

TEST_CASE("Fusion: anomaly type vote", "[fusion]") {
    FusionEngine engine;

    SECTION("rule detector overrides the majority") {
        const auto fused = engine.fuse({
            candidate("r1", "a", 0.9, AnomalyType::PATTERN),
            candidate("r1", "b", 0.9, AnomalyType::PATTERN),
            candidate("r1", "rules", 0.9, AnomalyType::BUSINESS)},
            {}, {"rules"}, 0.0);
        REQUIRE(fused.size() == 1);
        CHECK(fused[0].anomaly_type == AnomalyType::BUSINESS);
    }
    SECTION("majority wins without a rule hit") {
        const auto fused = engine.fuse({
            candidate("r1", "a", 0.9, AnomalyType::STATISTICAL),
            candidate("r1", "b", 0.9, AnomalyType::PATTERN),
            candidate("r1", "c", 0.9, AnomalyType::PATTERN)},
            {}, {"rules"}, 0.0);
        REQUIRE(fused.size() == 1);
        CHECK(fused[0].anomaly_type == AnomalyType::PATTERN);
    }
    SECTION("tie without a rule detector is lexicographic") {
        const auto fused = engine.fuse({
            candidate("r1", "forest", 0.9, AnomalyType::STATISTICAL),
            candidate("r1", "dbscan", 0.9, AnomalyType::PATTERN)},
            {}, {"rules"}, 0.0);
        REQUIRE(fused.size() == 1);
        CHECK(fused[0].anomaly_type == AnomalyType::PATTERN);
    }
}

TEST_CASE("Fusion: empty input", "[fusion]") {
    FusionEngine engine;
    CHECK(engine.fuse({}, {}, {}).empty());
    CHECK(engine.union_all({}).empty());
}

// ============================================================================
// Union mode
// ============================================================================

TEST_CASE("Fusion: union keeps the top candidate without threshold", "[fusion][union]") {
    FusionEngine engine;
    const auto fused = engine.union_all({
        candidate("r1", "a", 0.3, AnomalyType::PATTERN),
        candidate("r1", "b", 0.6, AnomalyType::TEMPORAL, 1.5),
        candidate("r2", "a", 0.1),
    });
    REQUIRE(fused.size() == 2);
    CHECK(fused[0].record_id == "r1");
    CHECK(fused[0].confidence == Approx(0.6));
    CHECK(fused[0].combined_score == Approx(1.5));
    CHECK(fused[0].anomaly_type == AnomalyType::TEMPORAL);
    CHECK(fused[0].contributing_detectors == std::set<std::string>{"a", "b"});
    CHECK(fused[1].record_id == "r2");
    CHECK(fused[1].severity == Severity::LOW);
}
