#pragma once

#include "models/imodel.hpp"

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Isolation forest: random axis-aligned partitioning trees.
 *
 * anomaly_score(x) = 2^(-E[h(x)] / c(psi)), in (0, 1], higher is more
 * anomalous. decision(x) = -anomaly_score(x) - offset, where offset is the
 * contamination percentile of the negated training scores; decision < 0
 * marks an outlier.
 *
 * Deterministic for a given seed.
 */
class IsolationForest : public IModel {
public:
    struct Params {
        size_t n_estimators = 100;
        size_t max_samples = 256;
        double contamination = 0.1;
        uint64_t seed = 42;
    };

    struct Node {
        int feature = -1;       // -1 for leaves
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        size_t size = 0;        // training samples reaching this node
    };

    struct Tree {
        std::vector<Node> nodes;
    };

    /**
     * @brief Fit on row-major samples. Returns nullptr if stop was requested.
     * @throws std::invalid_argument on empty or ragged input
     */
    [[nodiscard]] static std::shared_ptr<IsolationForest> fit(
        const std::vector<std::vector<double>>& rows,
        std::vector<std::string> feature_names,
        const Params& params,
        std::stop_token stop = {});

    [[nodiscard]] double anomaly_score(const std::vector<double>& x) const;
    [[nodiscard]] double decision(const std::vector<double>& x) const;

    [[nodiscard]] double offset() const { return offset_; }
    [[nodiscard]] size_t tree_count() const { return trees_.size(); }

    [[nodiscard]] std::string_view kind() const override { return "isolation_forest"; }
    [[nodiscard]] const std::vector<std::string>& feature_names() const override {
        return feature_names_;
    }

    /// Average path length of an unsuccessful BST search over n items
    [[nodiscard]] static double average_path_length(size_t n);

private:
    IsolationForest() = default;

    [[nodiscard]] double path_length(const Tree& tree, const std::vector<double>& x) const;

    std::vector<Tree> trees_;
    std::vector<std::string> feature_names_;
    size_t sample_size_ = 0;
    double offset_ = -0.5;
};

} // namespace auditfusion
