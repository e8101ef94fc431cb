#include "models/tree_ensemble_classifier.hpp"
#include "core/error.hpp"

#include <cmath>
#include <format>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace auditfusion {

std::shared_ptr<TreeEnsembleClassifier> TreeEnsembleClassifier::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("Tree ensemble model must be a JSON object");
    }
    const std::string type = doc.value("model_type", std::string("tree_ensemble"));
    if (type != "tree_ensemble") {
        throw std::runtime_error(std::format("Unsupported model_type: {}", type));
    }

    std::shared_ptr<TreeEnsembleClassifier> model(new TreeEnsembleClassifier());
    model->base_margin_ = doc.value("base_margin", 0.0);

    const auto trees_it = doc.find("trees");
    if (trees_it == doc.end() || !trees_it->is_array() || trees_it->empty()) {
        throw std::runtime_error("Tree ensemble model has no trees");
    }

    std::unordered_map<std::string, int> feature_index;

    for (size_t t = 0; t < trees_it->size(); ++t) {
        const auto& tree_doc = (*trees_it)[t];
        const auto nodes_it = tree_doc.find("nodes");
        if (nodes_it == tree_doc.end() || !nodes_it->is_array() || nodes_it->empty()) {
            throw std::runtime_error(std::format("Tree {} has no nodes", t));
        }

        Tree tree;
        const int count = static_cast<int>(nodes_it->size());
        tree.nodes.reserve(nodes_it->size());

        for (int i = 0; i < count; ++i) {
            const auto& nd = (*nodes_it)[i];
            Node node;
            if (nd.contains("leaf")) {
                node.leaf_value = nd.at("leaf").get<double>();
            } else {
                const auto name = nd.at("feature").get<std::string>();
                auto [it, inserted] = feature_index.try_emplace(
                    name, static_cast<int>(model->feature_names_.size()));
                if (inserted) model->feature_names_.push_back(name);

                node.feature = it->second;
                node.threshold = nd.at("threshold").get<double>();
                node.left = nd.at("left").get<int>();
                node.right = nd.at("right").get<int>();

                // Forward-only children guarantee traversal terminates
                if (node.left <= i || node.right <= i || node.left >= count || node.right >= count) {
                    throw std::runtime_error(
                        std::format("Tree {} node {}: child index out of range", t, i));
                }
            }
            tree.nodes.push_back(node);
        }
        model->trees_.push_back(std::move(tree));
    }
    return model;
}

std::shared_ptr<TreeEnsembleClassifier> TreeEnsembleClassifier::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open model file: " + path);
    }
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::format("Model file {} is not valid JSON: {}", path, e.what()));
    }
    return from_json(doc);
}

nlohmann::json TreeEnsembleClassifier::to_json() const {
    nlohmann::json trees = nlohmann::json::array();
    for (const auto& tree : trees_) {
        nlohmann::json nodes = nlohmann::json::array();
        for (const auto& n : tree.nodes) {
            if (n.feature < 0) {
                nodes.push_back({{"leaf", n.leaf_value}});
            } else {
                nodes.push_back({
                    {"feature", feature_names_[n.feature]},
                    {"threshold", n.threshold},
                    {"left", n.left},
                    {"right", n.right}
                });
            }
        }
        trees.push_back({{"nodes", std::move(nodes)}});
    }
    return {
        {"model_type", "tree_ensemble"},
        {"base_margin", base_margin_},
        {"trees", std::move(trees)}
    };
}

std::vector<size_t> TreeEnsembleClassifier::bind(const std::vector<std::string>& schema_names) const {
    std::vector<size_t> binding;
    binding.reserve(feature_names_.size());
    for (const auto& name : feature_names_) {
        size_t idx = schema_names.size();
        for (size_t i = 0; i < schema_names.size(); ++i) {
            if (schema_names[i] == name) { idx = i; break; }
        }
        if (idx == schema_names.size()) {
            throw ModelUnavailableError(
                std::format("Classifier feature '{}' not present in batch schema", name));
        }
        binding.push_back(idx);
    }
    return binding;
}

double TreeEnsembleClassifier::predict_proba(const std::vector<double>& row,
                                             const std::vector<size_t>& binding) const {
    double margin = base_margin_;
    for (const auto& tree : trees_) {
        int i = 0;
        while (tree.nodes[i].feature >= 0) {
            const auto& nd = tree.nodes[i];
            i = (row[binding[nd.feature]] < nd.threshold) ? nd.left : nd.right;
        }
        margin += tree.nodes[i].leaf_value;
    }
    return 1.0 / (1.0 + std::exp(-margin));
}

} // namespace auditfusion
