#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "models/tree_ensemble_classifier.hpp"
#include "core/error.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>

using namespace auditfusion;
using Catch::Approx;

namespace {

nlohmann::json stump_model() {
    return nlohmann::json::parse(R"({
        "model_type": "tree_ensemble",
        "base_margin": 0.5,
        "trees": [
            { "nodes": [
                { "feature": "amount_log", "threshold": 10.0, "left": 1, "right": 2 },
                { "leaf": -2.0 },
                { "leaf": 2.0 } ] },
            { "nodes": [
                { "feature": "amount_zscore", "threshold": 3.0, "left": 1, "right": 2 },
                { "leaf": 0.0 },
                { "leaf": 1.0 } ] }
        ]
    })");
}

double sigmoid(double m) { return 1.0 / (1.0 + std::exp(-m)); }

} // namespace

TEST_CASE("TreeEnsemble: predicts sigmoid of summed leaves", "[tree_ensemble]") {
    const auto model = TreeEnsembleClassifier::from_json(stump_model());
    REQUIRE(model);
    CHECK(model->tree_count() == 2);
    CHECK(model->kind() == "tree_ensemble");
    REQUIRE(model->feature_names().size() == 2);

    const std::vector<std::string> schema = {"amount", "amount_zscore", "amount_log"};
    const auto binding = model->bind(schema);
    REQUIRE(binding.size() == 2);

    // Row columns follow the batch schema
    CHECK(model->predict_proba({0.0, 0.5, 5.0}, binding) == Approx(sigmoid(0.5 - 2.0 + 0.0)));
    CHECK(model->predict_proba({0.0, 4.0, 12.0}, binding) == Approx(sigmoid(0.5 + 2.0 + 1.0)));
    // Threshold is exclusive on the left branch
    CHECK(model->predict_proba({0.0, 3.0, 10.0}, binding) == Approx(sigmoid(0.5 + 2.0 + 1.0)));
}

TEST_CASE("TreeEnsemble: missing schema feature makes the model unavailable", "[tree_ensemble]") {
    const auto model = TreeEnsembleClassifier::from_json(stump_model());
    CHECK_THROWS_AS(model->bind({"amount_log"}), ModelUnavailableError);
}

TEST_CASE("TreeEnsemble: rejects malformed documents", "[tree_ensemble]") {
    CHECK_THROWS(TreeEnsembleClassifier::from_json(nlohmann::json::array()));
    CHECK_THROWS(TreeEnsembleClassifier::from_json({{"model_type", "svm"}, {"trees", {}}}));
    CHECK_THROWS(TreeEnsembleClassifier::from_json({{"trees", nlohmann::json::array()}}));

    // Backward child reference would loop
    const auto looping = nlohmann::json::parse(R"({
        "trees": [ { "nodes": [
            { "feature": "a", "threshold": 1.0, "left": 0, "right": 1 },
            { "leaf": 1.0 } ] } ]
    })");
    CHECK_THROWS(TreeEnsembleClassifier::from_json(looping));
}

TEST_CASE("TreeEnsemble: to_json round trips through load_file", "[tree_ensemble]") {
    const auto model = TreeEnsembleClassifier::from_json(stump_model());
    const auto path = (std::filesystem::temp_directory_path() / "auditfusion_tree_model.json").string();
    {
        std::ofstream out(path);
        out << model->to_json().dump();
    }
    const auto loaded = TreeEnsembleClassifier::load_file(path);
    std::filesystem::remove(path);

    REQUIRE(loaded);
    CHECK(loaded->feature_names() == model->feature_names());
    const auto binding = loaded->bind({"amount_log", "amount_zscore"});
    CHECK(loaded->predict_proba({12.0, 4.0}, binding) == Approx(sigmoid(3.5)));

    CHECK_THROWS(TreeEnsembleClassifier::load_file("/nonexistent/model.json"));
}
