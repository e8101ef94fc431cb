#include "models/isolation_forest.hpp"
#include "core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

namespace auditfusion {

namespace {

constexpr double kEulerGamma = 0.5772156649015329;

struct TreeBuilder {
    const std::vector<std::vector<double>>& rows;
    std::mt19937_64& rng;
    size_t depth_limit;
    size_t dims;

    int build(IsolationForest::Tree& tree, std::vector<size_t> indices, size_t depth) {
        const int node_id = static_cast<int>(tree.nodes.size());
        tree.nodes.emplace_back();
        tree.nodes[node_id].size = indices.size();

        if (depth >= depth_limit || indices.size() <= 1) {
            return node_id;
        }

        // Try features in random order until one is non-constant on this node
        std::vector<size_t> features(dims);
        std::iota(features.begin(), features.end(), 0);
        std::shuffle(features.begin(), features.end(), rng);

        for (const size_t f : features) {
            double lo = rows[indices.front()][f];
            double hi = lo;
            for (const size_t i : indices) {
                lo = std::min(lo, rows[i][f]);
                hi = std::max(hi, rows[i][f]);
            }
            if (!(hi > lo)) continue;

            std::uniform_real_distribution<double> split(lo, hi);
            const double threshold = split(rng);

            std::vector<size_t> left_idx, right_idx;
            for (const size_t i : indices) {
                (rows[i][f] <= threshold ? left_idx : right_idx).push_back(i);
            }

            const int left = build(tree, std::move(left_idx), depth + 1);
            const int right = build(tree, std::move(right_idx), depth + 1);

            auto& node = tree.nodes[node_id];
            node.feature = static_cast<int>(f);
            node.threshold = threshold;
            node.left = left;
            node.right = right;
            return node_id;
        }
        return node_id;  // every feature constant: leaf
    }
};

} // anonymous namespace

double IsolationForest::average_path_length(size_t n) {
    if (n <= 1) return 0.0;
    if (n == 2) return 1.0;
    const double m = static_cast<double>(n);
    return 2.0 * (std::log(m - 1.0) + kEulerGamma) - 2.0 * (m - 1.0) / m;
}

std::shared_ptr<IsolationForest> IsolationForest::fit(
    const std::vector<std::vector<double>>& rows,
    std::vector<std::string> feature_names,
    const Params& params,
    std::stop_token stop) {

    if (rows.empty()) {
        throw std::invalid_argument("IsolationForest: no training data");
    }
    const size_t dims = rows.front().size();
    for (const auto& r : rows) {
        if (r.size() != dims) {
            throw std::invalid_argument("IsolationForest: inconsistent feature size");
        }
    }

    std::shared_ptr<IsolationForest> forest(new IsolationForest());
    forest->feature_names_ = std::move(feature_names);
    forest->sample_size_ = std::min(std::max<size_t>(params.max_samples, 1), rows.size());

    const size_t depth_limit = static_cast<size_t>(
        std::ceil(std::log2(std::max<double>(static_cast<double>(forest->sample_size_), 2.0))));

    std::mt19937_64 rng(params.seed);
    TreeBuilder builder{rows, rng, depth_limit, dims};

    std::vector<size_t> all(rows.size());
    std::iota(all.begin(), all.end(), 0);

    const size_t n_trees = std::max<size_t>(params.n_estimators, 1);
    forest->trees_.reserve(n_trees);
    for (size_t t = 0; t < n_trees; ++t) {
        if (stop.stop_requested()) return nullptr;

        std::vector<size_t> sample;
        if (forest->sample_size_ < rows.size()) {
            std::sample(all.begin(), all.end(), std::back_inserter(sample),
                        forest->sample_size_, rng);
        } else {
            sample = all;
        }

        Tree tree;
        builder.build(tree, std::move(sample), 0);
        forest->trees_.push_back(std::move(tree));
    }

    // Offset so that the contamination fraction of training rows falls below 0
    std::vector<double> neg_scores;
    neg_scores.reserve(rows.size());
    for (const auto& r : rows) {
        neg_scores.push_back(-forest->anomaly_score(r));
    }
    forest->offset_ = stats::quantile(std::move(neg_scores),
                                      std::clamp(params.contamination, 0.0, 0.5));
    return forest;
}

double IsolationForest::path_length(const Tree& tree, const std::vector<double>& x) const {
    int i = 0;
    size_t depth = 0;
    while (tree.nodes[i].feature >= 0) {
        const auto& nd = tree.nodes[i];
        i = (x[nd.feature] <= nd.threshold) ? nd.left : nd.right;
        ++depth;
    }
    return static_cast<double>(depth) + average_path_length(tree.nodes[i].size);
}

double IsolationForest::anomaly_score(const std::vector<double>& x) const {
    if (trees_.empty()) return 0.5;
    double total = 0.0;
    for (const auto& t : trees_) {
        total += path_length(t, x);
    }
    const double mean_depth = total / static_cast<double>(trees_.size());
    double c = average_path_length(sample_size_);
    if (c <= 0.0) c = 1.0;
    return std::pow(2.0, -mean_depth / c);
}

double IsolationForest::decision(const std::vector<double>& x) const {
    return -anomaly_score(x) - offset_;
}

} // namespace auditfusion
