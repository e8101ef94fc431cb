#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Configuration of one detector instance.
 *
 * name is unique per engine and keys results, weights and registered models.
 * type selects the implementation through the DetectorFactory.
 * params holds algorithm-specific settings (a JSON object).
 */
struct DetectorConfig {
    std::string name;
    std::string type;
    bool enabled = true;
    double weight = 1.0;
    double threshold = 0.5;
    nlohmann::json params = nlohmann::json::object();

    template<typename T>
    [[nodiscard]] T param(const std::string& key, T fallback) const {
        if (!params.is_object()) return fallback;
        return params.value(key, fallback);
    }
};

/**
 * @brief Built-in detector set: isolation_forest (0.3), autoencoder (0.3),
 * supervised_classifier (0.4, threshold 0.7), dbscan (1.0), audit_rules (1.0).
 */
[[nodiscard]] inline std::vector<DetectorConfig> default_detector_configs() {
    std::vector<DetectorConfig> configs;
    configs.push_back({"isolation_forest", "isolation_forest", true, 0.3, 0.5,
                       {{"n_estimators", 100}, {"max_samples", 256}, {"seed", 42}}});
    configs.push_back({"autoencoder", "autoencoder", true, 0.3, 0.5,
                       {{"fit_on_batch", true}}});
    configs.push_back({"supervised_classifier", "supervised_classifier", true, 0.4, 0.7,
                       nlohmann::json::object()});
    configs.push_back({"dbscan", "dbscan", true, 1.0, 0.5,
                       {{"eps", 0.5}, {"min_samples", 5}, {"baseline_confidence", 0.8}}});
    configs.push_back({"audit_rules", "audit_rules", true, 1.0, 0.5,
                       {{"amount_ceiling", 10000000.0}}});
    return configs;
}

} // namespace auditfusion
