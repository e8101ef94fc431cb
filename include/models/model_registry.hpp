#pragma once

#include "core/error.hpp"
#include "models/imodel.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace auditfusion {

class TreeEnsembleClassifier;

/**
 * @brief Registry of fitted model handles, keyed by detector name.
 *
 * Handles are immutable and shared read-only; a run resolves its handles once
 * before detectors start, so concurrent register/remove calls never affect a
 * run already in flight.
 *
 * Thread-safety: all methods may be called concurrently.
 */
class ModelRegistry {
public:
    ModelRegistry() = default;

    /// Register (or replace) the model served to a detector
    void register_model(const std::string& detector_name, std::shared_ptr<const IModel> model);

    /// @return Model handle, or nullptr if none is registered
    [[nodiscard]] std::shared_ptr<const IModel> find(const std::string& detector_name) const;

    bool remove(const std::string& detector_name);

    /**
     * @brief Load a tree-ensemble classifier from a JSON model file and register it.
     * @return The loaded handle, or CONFIGURATION_ERROR if the file is unusable
     */
    [[nodiscard]] Result<std::shared_ptr<const TreeEnsembleClassifier>> load_classifier(
        const std::string& detector_name, const std::string& path);

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] size_t size() const;

private:
    std::unordered_map<std::string, std::shared_ptr<const IModel>> models_;
    mutable std::shared_mutex mutex_;
};

} // namespace auditfusion
