#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace auditfusion {

/**
 * @brief Fitted model handle.
 *
 * Handles are immutable once fitted and shared read-only between runs via
 * the ModelRegistry. feature_names() is the schema the model was fit on.
 */
class IModel {
public:
    virtual ~IModel() = default;

    /// Model family, e.g. "isolation_forest", "tree_ensemble", "linear_autoencoder"
    [[nodiscard]] virtual std::string_view kind() const = 0;

    [[nodiscard]] virtual const std::vector<std::string>& feature_names() const = 0;

    [[nodiscard]] bool matches_schema(const std::vector<std::string>& names) const {
        return feature_names() == names;
    }
};

} // namespace auditfusion
