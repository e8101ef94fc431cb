#pragma once

#include "core/types.hpp"
#include "features/feature_vector.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Converts raw audit records into fixed-schema numeric feature vectors.
 *
 * Derivations:
 * - numeric fields pass through (missing -> batch median)
 * - monetary fields add log1p(|v|), |z-score|, percentile rank
 * - date fields expand to year/month/day/weekday/quarter (+ day delta)
 * - text fields add frequency count and first-seen label index
 *
 * Output order is identical for every vector of one batch.
 */
class FeatureBuilder {
public:
    struct Config {
        std::string id_field = "id";
        std::vector<std::string> amount_keywords = {"amount", "money", "value", "balance",
                                                    "金额", "余额"};
        std::vector<std::string> date_keywords = {"date", "time", "日期", "时间"};
        std::string unknown_token = "unknown";
    };

    FeatureBuilder() : FeatureBuilder(Config{}) {}
    explicit FeatureBuilder(Config config);

    /**
     * @brief Build feature vectors for one batch.
     * @return Empty batch if there are no records or no usable fields
     * @throws FeatureExtractionError on malformed input
     */
    [[nodiscard]] FeatureBatch build(const std::vector<Record>& records) const;

    /// Parse "YYYY-MM-DD" or "YYYY/MM/DD", optionally followed by a time part
    [[nodiscard]] static std::optional<std::chrono::year_month_day> parse_date(
        const std::string& text);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    enum class FieldKind { NUMERIC, DATE, TEXT };

    struct FieldPlan {
        std::string name;
        FieldKind kind = FieldKind::TEXT;
        bool monetary = false;
    };

    [[nodiscard]] std::vector<FieldPlan> plan_fields(const std::vector<Record>& records) const;

    [[nodiscard]] std::string record_id_of(const Record& record, size_t index) const;

    Config config_;
};

} // namespace auditfusion
