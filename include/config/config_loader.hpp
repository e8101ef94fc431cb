#pragma once

#include "coordinator/detection_coordinator.hpp"
#include "detectors/detector_config.hpp"

#include <string>
#include <vector>

namespace auditfusion {

// ============================================================================
// Store Config
// ============================================================================

struct StoreConfig {
    std::string type = "memory";        // "memory" | "jsonl"
    std::string directory;              // required for jsonl
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Model Files (fitted models registered at startup)
// ============================================================================

struct ModelFileConfig {
    std::string detector;               // detector name the model serves
    std::string path;                   // tree-ensemble JSON model file
};

// ============================================================================
// Top-level Engine Config (mirrors TOML hierarchy)
// ============================================================================

struct EngineConfig {
    DetectionCoordinator::Config engine;
    std::vector<DetectorConfig> detectors;      // empty = built-in defaults
    std::vector<ModelFileConfig> models;
    StoreConfig store;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * @brief Loads engine.toml.
 *
 * Sections: [engine], [features], [severity], [store], [logging],
 * [[models]], [[detectors]] with a [detectors.params] sub-table that is
 * converted to the detector's JSON params.
 *
 * String values may reference environment variables as ${VAR}. A top-level
 * include = "other.toml" (or an array) merges other files underneath.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to engine.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// @return One message per problem, naming the offending field
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

private:
    [[nodiscard]] static LoadResult validate_and_return(EngineConfig config);
};

} // namespace auditfusion
