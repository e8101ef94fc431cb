#pragma once

#include "detectors/idetector.hpp"

namespace auditfusion {

/**
 * @brief Deterministic audit rules on raw monetary fields (type "audit_rules").
 *
 * Rules, each counting as one violation per offending field:
 * - zero amount
 * - negative amount where the field name or an account attribute matches a
 *   never-negative pattern
 * - absolute amount above the ceiling
 *
 * Any violation yields one candidate: confidence = rule confidence (0.9),
 * raw score = violation count, type business. Never needs a model.
 */
class RuleHeuristicDetector : public IDetector {
public:
    struct Rules {
        bool flag_zero_amount = true;
        double amount_ceiling = 10'000'000.0;
        std::vector<std::string> never_negative_patterns = {"receivable", "应收"};
        std::vector<std::string> account_fields = {"account"};
        double confidence = 0.9;
    };

    /// @throws ConfigurationError on invalid params
    explicit RuleHeuristicDetector(const DetectorConfig& config);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string_view type() const override { return "audit_rules"; }

    [[nodiscard]] std::vector<AnomalyCandidate> detect(
        const FeatureBatch& batch, const DetectionContext& ctx) const override;

    /// Violation descriptions for one vector (empty = clean)
    [[nodiscard]] std::vector<std::string> check(const FeatureVector& fv) const;

    [[nodiscard]] const Rules& rules() const { return rules_; }

private:
    std::string name_;
    Rules rules_;
};

} // namespace auditfusion
