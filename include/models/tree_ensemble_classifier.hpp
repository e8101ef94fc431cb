#pragma once

#include "models/imodel.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Binary gradient-boosted tree ensemble (logistic link).
 *
 * P(anomaly | x) = sigmoid(base_margin + sum of leaf values over trees).
 * Split nodes address features by name; samples go left when
 * x[feature] < threshold.
 *
 * JSON model format:
 *   {
 *     "model_type": "tree_ensemble",
 *     "base_margin": 0.0,
 *     "trees": [ { "nodes": [
 *         { "feature": "amount_log", "threshold": 14.2, "left": 1, "right": 2 },
 *         { "leaf": -1.5 },
 *         { "leaf": 2.0 } ] } ]
 *   }
 * Child indices must point forward within the same tree.
 */
class TreeEnsembleClassifier : public IModel {
public:
    struct Node {
        int feature = -1;       // index into feature_names(); -1 for leaves
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        double leaf_value = 0.0;
    };

    struct Tree {
        std::vector<Node> nodes;
    };

    /// @throws std::runtime_error on a malformed model document
    [[nodiscard]] static std::shared_ptr<TreeEnsembleClassifier> from_json(const nlohmann::json& doc);

    /// @throws std::runtime_error if the file cannot be read or parsed
    [[nodiscard]] static std::shared_ptr<TreeEnsembleClassifier> load_file(const std::string& path);

    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Map the model's features onto a batch schema.
     * @return Column index per model feature
     * @throws ModelUnavailableError if a model feature is absent from the schema
     */
    [[nodiscard]] std::vector<size_t> bind(const std::vector<std::string>& schema_names) const;

    /// Probability for one row, given the column binding from bind()
    [[nodiscard]] double predict_proba(const std::vector<double>& row,
                                       const std::vector<size_t>& binding) const;

    [[nodiscard]] size_t tree_count() const { return trees_.size(); }

    [[nodiscard]] std::string_view kind() const override { return "tree_ensemble"; }
    [[nodiscard]] const std::vector<std::string>& feature_names() const override {
        return feature_names_;
    }

private:
    TreeEnsembleClassifier() = default;

    std::vector<Tree> trees_;
    std::vector<std::string> feature_names_;
    double base_margin_ = 0.0;
};

} // namespace auditfusion
