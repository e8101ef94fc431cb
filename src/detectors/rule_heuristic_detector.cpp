#include "detectors/rule_heuristic_detector.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace auditfusion {

namespace {

std::vector<std::string> string_list_param(const DetectorConfig& config, const std::string& key,
                                           std::vector<std::string> fallback) {
    if (!config.params.is_object() || !config.params.contains(key)) return fallback;
    const auto& arr = config.params.at(key);
    if (!arr.is_array()) {
        throw ConfigurationError(std::format("detector '{}': {} must be an array of strings",
                                             config.name, key));
    }
    std::vector<std::string> result;
    for (const auto& item : arr) {
        if (!item.is_string()) {
            throw ConfigurationError(std::format("detector '{}': {} must be an array of strings",
                                                 config.name, key));
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

} // anonymous namespace

RuleHeuristicDetector::RuleHeuristicDetector(const DetectorConfig& config)
    : name_(config.name) {
    rules_.flag_zero_amount = config.param<bool>("flag_zero_amount", rules_.flag_zero_amount);
    rules_.amount_ceiling = config.param<double>("amount_ceiling", rules_.amount_ceiling);
    rules_.confidence = config.param<double>("confidence", rules_.confidence);
    rules_.never_negative_patterns = string_list_param(
        config, "never_negative_patterns", rules_.never_negative_patterns);
    rules_.account_fields = string_list_param(config, "account_fields", rules_.account_fields);

    if (!(rules_.amount_ceiling > 0.0)) {
        throw ConfigurationError(std::format("detector '{}': amount_ceiling must be > 0", name_));
    }
    if (rules_.confidence < 0.0 || rules_.confidence > 1.0) {
        throw ConfigurationError(std::format("detector '{}': confidence must be in [0, 1]", name_));
    }
}

std::vector<std::string> RuleHeuristicDetector::check(const FeatureVector& fv) const {
    std::vector<std::string> violations;

    bool never_negative_account = false;
    for (const auto& field : rules_.account_fields) {
        const auto it = fv.attributes.find(field);
        if (it != fv.attributes.end() &&
            utils::contains_any(it->second, rules_.never_negative_patterns)) {
            never_negative_account = true;
            break;
        }
    }

    for (const auto& [field, amount] : fv.amounts) {
        if (rules_.flag_zero_amount && amount == 0.0) {
            violations.push_back(std::format("zero amount in '{}'", field));
        }
        if (amount < 0.0 &&
            (never_negative_account ||
             utils::contains_any(field, rules_.never_negative_patterns))) {
            violations.push_back(std::format("negative amount {} in never-negative '{}'",
                                             amount, field));
        }
        if (std::abs(amount) > rules_.amount_ceiling) {
            violations.push_back(std::format("amount {:.2f} in '{}' exceeds ceiling {:.2f}",
                                             amount, field, rules_.amount_ceiling));
        }
    }
    return violations;
}

std::vector<AnomalyCandidate> RuleHeuristicDetector::detect(
    const FeatureBatch& batch, const DetectionContext& ctx) const {

    std::vector<AnomalyCandidate> candidates;
    for (const auto& fv : batch.vectors) {
        if (ctx.stop.stop_requested()) return {};

        const auto violations = check(fv);
        if (violations.empty()) continue;

        AnomalyCandidate c;
        c.record_id = fv.record_id;
        c.record_index = fv.record_index;
        c.detector_name = name_;
        c.raw_score = static_cast<double>(violations.size());
        c.confidence = rules_.confidence;
        c.anomaly_type = AnomalyType::BUSINESS;
        c.explanation = "audit rule violation: " + utils::join(violations, "; ");
        candidates.push_back(std::move(c));
    }
    return candidates;
}

} // namespace auditfusion
