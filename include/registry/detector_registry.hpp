#pragma once

#include "core/types.hpp"
#include "core/worker_pool.hpp"
#include "detectors/idetector.hpp"
#include "models/model_registry.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Configured detector instances plus the worker pool that runs them.
 *
 * Configuration lives in an immutable Snapshot. reconfigure() builds a new
 * snapshot and swaps it in; runs already holding the previous snapshot keep
 * using it, so no run ever observes a half-applied configuration.
 *
 * run_all() submits one task per selected, enabled detector and blocks until
 * each task finishes or the per-detector deadline passes. Detector exceptions
 * never escape: ModelUnavailableError -> skipped, anything else -> failed.
 *
 * Thread-safety: all public methods may be called concurrently.
 */
class DetectorRegistry {
public:
    struct Config {
        size_t max_workers = 4;
        std::chrono::milliseconds detector_timeout{0};   // 0 = wait indefinitely
        double contamination = 0.1;                      // default for detectors
    };

    struct Entry {
        DetectorConfig config;
        std::shared_ptr<const IDetector> detector;
    };

    struct Snapshot {
        std::vector<Entry> entries;     // in configuration order

        [[nodiscard]] const Entry* find(const std::string& name) const;
        [[nodiscard]] double weight_of(const std::string& name) const;
        [[nodiscard]] std::map<std::string, double> weights() const;
    };

    /// @throws ConfigurationError if any config is invalid
    DetectorRegistry(const std::vector<DetectorConfig>& configs, const Config& config);
    ~DetectorRegistry();

    DetectorRegistry(const DetectorRegistry&) = delete;
    DetectorRegistry& operator=(const DetectorRegistry&) = delete;

    /**
     * @brief Replace the detector set atomically.
     * @throws ConfigurationError if any config is invalid; the old set stays active
     */
    void reconfigure(const std::vector<DetectorConfig>& configs);

    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;

    /**
     * @brief Run the selected detectors concurrently.
     *
     * @param batch Shared read-only feature batch
     * @param snapshot Configuration snapshot for this run
     * @param selection Detector names; empty = every enabled detector
     * @param models Registry consulted once per detector before dispatch
     * @param stop Run cancellation token
     * @return One result per executed detector, keyed by detector name
     * @throws ConfigurationError if the selection names an unknown detector
     */
    [[nodiscard]] std::map<std::string, DetectorRunResult> run_all(
        std::shared_ptr<const FeatureBatch> batch,
        std::shared_ptr<const Snapshot> snapshot,
        const std::vector<std::string>& selection,
        const ModelRegistry& models,
        std::stop_token stop = {});

    /// Per-detector performance rows for the Result Store
    [[nodiscard]] static std::vector<DetectorPerformance> performance_rows(
        const std::string& run_id,
        const std::map<std::string, DetectorRunResult>& results,
        size_t dataset_size);

    /// Validate configs and instantiate their detectors
    [[nodiscard]] static std::shared_ptr<const Snapshot> build_snapshot(
        const std::vector<DetectorConfig>& configs);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    WorkerPool pool_;

    std::shared_ptr<const Snapshot> snapshot_;
    mutable std::shared_mutex snapshot_mutex_;
};

} // namespace auditfusion
