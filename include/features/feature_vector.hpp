#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace auditfusion {

enum class FeatureRole {
    RAW_NUMERIC,
    AMOUNT_LOG,
    AMOUNT_ZSCORE,
    AMOUNT_PERCENTILE,
    DATE_YEAR,
    DATE_MONTH,
    DATE_DAY,
    DATE_WEEKDAY,
    DATE_QUARTER,
    DATE_DELTA,
    CATEGORY_FREQUENCY,
    CATEGORY_LABEL      // Closed per-run mapping; no magnitude meaning
};

struct FeatureInfo {
    std::string source_field;
    FeatureRole role = FeatureRole::RAW_NUMERIC;
    bool monetary = false;
};

/**
 * @brief Feature-name schema shared by every vector of one batch.
 */
struct FeatureSchema {
    std::vector<std::string> names;
    std::vector<FeatureInfo> info;

    [[nodiscard]] size_t size() const { return names.size(); }

    /// Index of a feature by name, or -1
    [[nodiscard]] int index_of(const std::string& name) const {
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name) return static_cast<int>(i);
        }
        return -1;
    }

    void add(std::string name, FeatureInfo fi) {
        names.push_back(std::move(name));
        info.push_back(std::move(fi));
    }
};

/**
 * @brief Numeric representation of one Record for one run.
 *
 * values.size() == schema->size(); all values finite.
 * attributes carries the record's text fields (after "unknown" imputation)
 * for rule checks and context. amounts holds the monetary fields that were
 * actually present on the record, before imputation; numeric text such as
 * "1,200.00" is included even when the column is not uniformly numeric.
 */
struct FeatureVector {
    std::string record_id;
    size_t record_index = 0;
    std::vector<double> values;
    std::shared_ptr<const FeatureSchema> schema;
    std::map<std::string, std::string> attributes;
    std::map<std::string, double> amounts;

    [[nodiscard]] const std::vector<std::string>& names() const { return schema->names; }
};

/**
 * @brief Output of the Feature Builder: one schema plus one vector per record.
 */
struct FeatureBatch {
    std::shared_ptr<const FeatureSchema> schema;
    std::vector<FeatureVector> vectors;

    [[nodiscard]] bool empty() const { return vectors.empty() || !schema || schema->size() == 0; }
    [[nodiscard]] size_t size() const { return vectors.size(); }

    /// Row-major copy of the feature values
    [[nodiscard]] std::vector<std::vector<double>> matrix() const {
        std::vector<std::vector<double>> rows;
        rows.reserve(vectors.size());
        for (const auto& v : vectors) rows.push_back(v.values);
        return rows;
    }
};

} // namespace auditfusion
