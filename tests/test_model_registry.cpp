#include <catch2/catch_test_macros.hpp>
#include "models/model_registry.hpp"
#include "models/tree_ensemble_classifier.hpp"

#include <filesystem>
#include <fstream>

using namespace auditfusion;

namespace {

std::shared_ptr<const TreeEnsembleClassifier> tiny_model() {
    return TreeEnsembleClassifier::from_json(nlohmann::json::parse(R"({
        "trees": [ { "nodes": [ { "leaf": 1.0 } ] } ]
    })"));
}

} // namespace

TEST_CASE("ModelRegistry: register, find, replace, remove", "[model_registry]") {
    ModelRegistry registry;
    CHECK(registry.size() == 0);
    CHECK(registry.find("supervised_classifier") == nullptr);

    auto first = tiny_model();
    registry.register_model("supervised_classifier", first);
    CHECK(registry.find("supervised_classifier") == first);

    auto second = tiny_model();
    registry.register_model("supervised_classifier", second);
    CHECK(registry.find("supervised_classifier") == second);
    CHECK(registry.size() == 1);

    // Handles already given out stay valid after removal
    auto held = registry.find("supervised_classifier");
    CHECK(registry.remove("supervised_classifier"));
    CHECK_FALSE(registry.remove("supervised_classifier"));
    CHECK(held->kind() == "tree_ensemble");
}

TEST_CASE("ModelRegistry: null models are ignored", "[model_registry]") {
    ModelRegistry registry;
    registry.register_model("x", nullptr);
    CHECK(registry.size() == 0);
}

TEST_CASE("ModelRegistry: names are sorted", "[model_registry]") {
    ModelRegistry registry;
    registry.register_model("b", tiny_model());
    registry.register_model("a", tiny_model());
    CHECK(registry.names() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("ModelRegistry: load_classifier from file", "[model_registry]") {
    ModelRegistry registry;
    const auto path = (std::filesystem::temp_directory_path() / "auditfusion_registry_model.json").string();
    {
        std::ofstream out(path);
        out << R"({"model_type": "tree_ensemble", "trees": [{"nodes": [{"leaf": 0.3}]}]})";
    }

    auto loaded = registry.load_classifier("clf", path);
    std::filesystem::remove(path);
    REQUIRE(loaded.is_ok());
    CHECK(registry.find("clf") != nullptr);

    auto missing = registry.load_classifier("other", "/nonexistent/model.json");
    CHECK(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    CHECK(registry.find("other") == nullptr);
}
