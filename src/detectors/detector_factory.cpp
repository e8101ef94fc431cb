#include "detectors/detector_factory.hpp"
#include "core/error.hpp"
#include "detectors/density_cluster_detector.hpp"
#include "detectors/outlier_ensemble_detector.hpp"
#include "detectors/reconstruction_detector.hpp"
#include "detectors/rule_heuristic_detector.hpp"
#include "detectors/supervised_classifier_detector.hpp"

#include <algorithm>
#include <format>

namespace auditfusion {

DetectorFactory& DetectorFactory::instance() {
    static DetectorFactory factory;
    return factory;
}

DetectorFactory::DetectorFactory() {
    factories_["isolation_forest"] = [](const DetectorConfig& c) {
        return std::make_unique<OutlierEnsembleDetector>(c);
    };
    factories_["dbscan"] = [](const DetectorConfig& c) {
        return std::make_unique<DensityClusterDetector>(c);
    };
    factories_["supervised_classifier"] = [](const DetectorConfig& c) {
        return std::make_unique<SupervisedClassifierDetector>(c);
    };
    factories_["autoencoder"] = [](const DetectorConfig& c) {
        return std::make_unique<ReconstructionDetector>(c);
    };
    factories_["audit_rules"] = [](const DetectorConfig& c) {
        return std::make_unique<RuleHeuristicDetector>(c);
    };
}

void DetectorFactory::register_type(const std::string& type, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[type] = std::move(factory);
}

std::unique_ptr<IDetector> DetectorFactory::create(const DetectorConfig& config) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = factories_.find(config.type);
        if (it == factories_.end()) {
            throw ConfigurationError(std::format(
                "detector '{}': unknown detector type '{}'", config.name, config.type));
        }
        factory = it->second;
    }

    try {
        return factory(config);
    } catch (const nlohmann::json::exception& e) {
        // Wrong param value type, e.g. a string where a number is expected
        throw ConfigurationError(std::format("detector '{}': invalid params: {}",
                                             config.name, e.what()));
    }
}

bool DetectorFactory::has_type(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(type) > 0;
}

std::vector<std::string> DetectorFactory::types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [type, _] : factories_) {
        result.push_back(type);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace auditfusion
