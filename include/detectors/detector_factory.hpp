#pragma once

#include "detectors/idetector.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace auditfusion {

/**
 * @brief Maps detector type names to constructors.
 *
 * The five built-in types are registered on first use. Extra types can be
 * added at startup; adding a detector means implementing IDetector and
 * registering a factory, never branching on names elsewhere.
 *
 * Usage:
 *   DetectorFactory::instance().register_type(
 *       "my_detector", [](const DetectorConfig& c) { return std::make_unique<MyDetector>(c); });
 *   auto detector = DetectorFactory::instance().create(config);
 */
class DetectorFactory {
public:
    using Factory = std::function<std::unique_ptr<IDetector>(const DetectorConfig&)>;

    static DetectorFactory& instance();

    void register_type(const std::string& type, Factory factory);

    /**
     * @brief Instantiate a detector for a config.
     * @throws ConfigurationError for unknown types or invalid params
     */
    [[nodiscard]] std::unique_ptr<IDetector> create(const DetectorConfig& config) const;

    [[nodiscard]] bool has_type(const std::string& type) const;
    [[nodiscard]] std::vector<std::string> types() const;

private:
    DetectorFactory();

    std::unordered_map<std::string, Factory> factories_;
    mutable std::mutex mutex_;
};

} // namespace auditfusion
