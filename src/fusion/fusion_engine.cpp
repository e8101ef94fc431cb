#include "fusion/fusion_engine.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace auditfusion {

// ============================================================================
// SeverityPolicy
// ============================================================================

Severity SeverityPolicy::classify(double confidence, double combined_score) const {
    if (confidence >= critical_confidence || combined_score >= critical_score) return Severity::CRITICAL;
    if (confidence >= high_confidence || combined_score >= high_score) return Severity::HIGH;
    if (confidence >= medium_confidence || combined_score >= medium_score) return Severity::MEDIUM;
    return Severity::LOW;
}

std::string SeverityPolicy::validate() const {
    for (const double c : {critical_confidence, high_confidence, medium_confidence}) {
        if (c < 0.0 || c > 1.0) return "severity confidence thresholds must be in [0, 1]";
    }
    if (!(critical_confidence >= high_confidence && high_confidence >= medium_confidence)) {
        return "severity confidence thresholds must satisfy critical >= high >= medium";
    }
    if (!(critical_score >= high_score && high_score >= medium_score)) {
        return "severity score thresholds must satisfy critical >= high >= medium";
    }
    return {};
}

// ============================================================================
// FusionEngine
// ============================================================================

FusionEngine::FusionEngine(Config config)
    : config_(std::move(config)) {}

std::map<std::string, std::vector<const AnomalyCandidate*>> FusionEngine::group(
    const std::vector<AnomalyCandidate>& candidates) {

    std::map<std::string, std::vector<const AnomalyCandidate*>> groups;
    for (const auto& c : candidates) {
        groups[c.record_id].push_back(&c);
    }

    for (auto& [_, members] : groups) {
        std::stable_sort(members.begin(), members.end(),
            [](const AnomalyCandidate* a, const AnomalyCandidate* b) {
                if (a->detector_name != b->detector_name) return a->detector_name < b->detector_name;
                return a->confidence > b->confidence;
            });
        // One vote per detector per record: keep its most confident candidate
        members.erase(std::unique(members.begin(), members.end(),
            [](const AnomalyCandidate* a, const AnomalyCandidate* b) {
                return a->detector_name == b->detector_name;
            }), members.end());
    }
    return groups;
}

AnomalyType FusionEngine::vote_type(const std::vector<const AnomalyCandidate*>& group,
                                    const std::set<std::string>& authoritative) {
    // A business-rule hit names the anomaly regardless of the other votes
    for (const auto* c : group) {
        if (authoritative.contains(c->detector_name)) return c->anomaly_type;
    }

    std::map<std::string, size_t> votes;
    for (const auto* c : group) {
        ++votes[anomaly_type_to_string(c->anomaly_type)];
    }

    // Highest count wins; map order makes ties lexicographic
    std::string best_type;
    size_t best = 0;
    for (const auto& [type, n] : votes) {
        if (n > best) {
            best = n;
            best_type = type;
        }
    }
    return anomaly_type_from_string(best_type).value_or(AnomalyType::STATISTICAL);
}

std::string FusionEngine::explain(const std::vector<const AnomalyCandidate*>& group) {
    std::vector<std::string> names;
    std::vector<std::string> parts;
    for (const auto* c : group) {
        names.push_back(c->detector_name);
        parts.push_back(std::format("{}: {}", c->detector_name, c->explanation));
    }
    return std::format("flagged by {} detector{} ({}): {}",
        group.size(), group.size() == 1 ? "" : "s",
        utils::join(names, ", "), utils::join(parts, "; "));
}

void FusionEngine::rank(std::vector<IntegratedAnomaly>& anomalies) {
    std::sort(anomalies.begin(), anomalies.end(),
        [](const IntegratedAnomaly& a, const IntegratedAnomaly& b) {
            if (a.confidence != b.confidence) return a.confidence > b.confidence;
            return a.record_id < b.record_id;
        });
}

std::vector<IntegratedAnomaly> FusionEngine::fuse(
    const std::vector<AnomalyCandidate>& candidates,
    const std::map<std::string, double>& weights,
    const std::set<std::string>& authoritative,
    double min_confidence) const {

    std::vector<IntegratedAnomaly> result;

    for (const auto& [record_id, members] : group(candidates)) {
        double total_weight = 0.0;
        double weighted_conf = 0.0;
        double weighted_score = 0.0;

        for (const auto* c : members) {
            const auto it = weights.find(c->detector_name);
            const double w = (it != weights.end()) ? it->second : config_.default_weight;
            total_weight += w;
            weighted_conf += std::clamp(c->confidence, 0.0, 1.0) * w;
            weighted_score += c->raw_score * w;
        }
        if (!(total_weight > 0.0)) continue;

        const double confidence = std::clamp(weighted_conf / total_weight, 0.0, 1.0);
        const double score = weighted_score / total_weight;
        if (confidence < min_confidence) continue;

        IntegratedAnomaly a;
        a.anomaly_id = utils::generate_uuid();
        a.record_id = record_id;
        a.record_index = members.front()->record_index;
        a.anomaly_type = vote_type(members, authoritative);
        a.confidence = confidence;
        a.combined_score = score;
        a.severity = config_.severity.classify(confidence, score);
        for (const auto* c : members) a.contributing_detectors.insert(c->detector_name);
        a.explanation = explain(members);
        result.push_back(std::move(a));
    }

    rank(result);
    return result;
}

std::vector<IntegratedAnomaly> FusionEngine::union_all(
    const std::vector<AnomalyCandidate>& candidates) const {

    std::vector<IntegratedAnomaly> result;

    for (const auto& [record_id, members] : group(candidates)) {
        const auto* top = *std::max_element(members.begin(), members.end(),
            [](const AnomalyCandidate* a, const AnomalyCandidate* b) {
                return a->confidence < b->confidence;   // first maximum wins
            });

        IntegratedAnomaly a;
        a.anomaly_id = utils::generate_uuid();
        a.record_id = record_id;
        a.record_index = top->record_index;
        a.anomaly_type = top->anomaly_type;
        a.confidence = std::clamp(top->confidence, 0.0, 1.0);
        a.combined_score = top->raw_score;
        a.severity = config_.severity.classify(a.confidence, a.combined_score);
        for (const auto* c : members) a.contributing_detectors.insert(c->detector_name);
        a.explanation = explain(members);
        result.push_back(std::move(a));
    }

    rank(result);
    return result;
}

} // namespace auditfusion
