#include "models/model_registry.hpp"
#include "models/tree_ensemble_classifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace auditfusion {

void ModelRegistry::register_model(const std::string& detector_name,
                                   std::shared_ptr<const IModel> model) {
    if (!model) return;
    const auto kind = std::string(model->kind());
    {
        std::unique_lock lock(mutex_);
        models_[detector_name] = std::move(model);
    }
    utils::log::info(std::format("ModelRegistry: registered {} model for detector '{}'",
                                 kind, detector_name));
}

std::shared_ptr<const IModel> ModelRegistry::find(const std::string& detector_name) const {
    std::shared_lock lock(mutex_);
    const auto it = models_.find(detector_name);
    return it != models_.end() ? it->second : nullptr;
}

bool ModelRegistry::remove(const std::string& detector_name) {
    std::unique_lock lock(mutex_);
    return models_.erase(detector_name) > 0;
}

Result<std::shared_ptr<const TreeEnsembleClassifier>> ModelRegistry::load_classifier(
    const std::string& detector_name, const std::string& path) {
    std::shared_ptr<const TreeEnsembleClassifier> model;
    try {
        model = TreeEnsembleClassifier::load_file(path);
    } catch (const std::exception& e) {
        utils::log::error(std::format("ModelRegistry: cannot load classifier for '{}': {}",
                                      detector_name, e.what()));
        return Result<std::shared_ptr<const TreeEnsembleClassifier>>::error(
            ErrorCategory::CONFIGURATION_ERROR, e.what());
    }
    register_model(detector_name, model);
    return Result<std::shared_ptr<const TreeEnsembleClassifier>>::ok(std::move(model));
}

std::vector<std::string> ModelRegistry::names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(models_.size());
    for (const auto& [name, _] : models_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t ModelRegistry::size() const {
    std::shared_lock lock(mutex_);
    return models_.size();
}

} // namespace auditfusion
