#include "registry/detector_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "detectors/detector_factory.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <future>
#include <mutex>
#include <unordered_set>

namespace auditfusion {

// ============================================================================
// Snapshot
// ============================================================================

const DetectorRegistry::Entry* DetectorRegistry::Snapshot::find(const std::string& name) const {
    for (const auto& e : entries) {
        if (e.config.name == name) return &e;
    }
    return nullptr;
}

double DetectorRegistry::Snapshot::weight_of(const std::string& name) const {
    const auto* e = find(name);
    return e ? e->config.weight : 0.0;
}

std::map<std::string, double> DetectorRegistry::Snapshot::weights() const {
    std::map<std::string, double> result;
    for (const auto& e : entries) {
        result[e.config.name] = e.config.weight;
    }
    return result;
}

std::shared_ptr<const DetectorRegistry::Snapshot> DetectorRegistry::build_snapshot(
    const std::vector<DetectorConfig>& configs) {

    auto snap = std::make_shared<Snapshot>();
    std::unordered_set<std::string> names;

    for (const auto& cfg : configs) {
        if (cfg.name.empty()) {
            throw ConfigurationError("detector name must not be empty");
        }
        if (!names.insert(cfg.name).second) {
            throw ConfigurationError(std::format("duplicate detector name '{}'", cfg.name));
        }
        if (!std::isfinite(cfg.weight) || cfg.weight < 0.0) {
            throw ConfigurationError(std::format("detector '{}': weight must be >= 0", cfg.name));
        }
        if (!std::isfinite(cfg.threshold)) {
            throw ConfigurationError(std::format("detector '{}': threshold must be finite", cfg.name));
        }
        if (!cfg.params.is_object()) {
            throw ConfigurationError(std::format("detector '{}': params must be an object", cfg.name));
        }

        Entry entry;
        entry.config = cfg;
        entry.detector = DetectorFactory::instance().create(cfg);
        snap->entries.push_back(std::move(entry));
    }
    return snap;
}

// ============================================================================
// Registry
// ============================================================================

DetectorRegistry::DetectorRegistry(const std::vector<DetectorConfig>& configs,
                                   const Config& config)
    : config_(config),
      pool_(std::max<size_t>(config.max_workers, 1)),
      snapshot_(build_snapshot(configs)) {}

DetectorRegistry::~DetectorRegistry() {
    pool_.shutdown();
}

void DetectorRegistry::reconfigure(const std::vector<DetectorConfig>& configs) {
    auto next = build_snapshot(configs);   // throws before anything is swapped
    {
        std::unique_lock lock(snapshot_mutex_);
        snapshot_ = std::move(next);
    }
    utils::log::info(std::format("DetectorRegistry: reconfigured with {} detectors",
                                 configs.size()));
}

std::shared_ptr<const DetectorRegistry::Snapshot> DetectorRegistry::snapshot() const {
    std::shared_lock lock(snapshot_mutex_);
    return snapshot_;
}

std::map<std::string, DetectorRunResult> DetectorRegistry::run_all(
    std::shared_ptr<const FeatureBatch> batch,
    std::shared_ptr<const Snapshot> snapshot,
    const std::vector<std::string>& selection,
    const ModelRegistry& models,
    std::stop_token stop) {

    if (!snapshot) snapshot = this->snapshot();

    // Resolve the selection up front: unknown names abort before dispatch
    std::vector<const Entry*> selected;
    if (selection.empty()) {
        for (const auto& e : snapshot->entries) {
            if (e.config.enabled) selected.push_back(&e);
        }
    } else {
        std::unordered_set<std::string> seen;
        for (const auto& name : selection) {
            const auto* e = snapshot->find(name);
            if (!e) {
                throw ConfigurationError(std::format("unknown detector '{}'", name));
            }
            if (!seen.insert(name).second) continue;
            if (!e->config.enabled) {
                utils::log::debug(std::format("DetectorRegistry: '{}' disabled, not run", name));
                continue;
            }
            selected.push_back(e);
        }
    }

    struct Pending {
        const Entry* entry;
        std::shared_ptr<std::stop_source> cancel;
        std::future<DetectorRunResult> future;
    };

    std::vector<Pending> pending;
    pending.reserve(selected.size());
    const auto dispatched_at = std::chrono::steady_clock::now();

    for (const auto* entry : selected) {
        auto cancel = std::make_shared<std::stop_source>();
        auto model = models.find(entry->config.name);
        const double contamination = config_.contamination;

        // The task co-owns everything it touches so a late finisher never dangles
        auto task = [snapshot, entry, batch, model, cancel, stop, contamination]() {
            DetectorRunResult r;
            r.detector_name = entry->config.name;
            r.detector_type = std::string(entry->detector->type());

            std::stop_callback link(stop, [&cancel] { cancel->request_stop(); });
            utils::Timer timer;
            try {
                const DetectionContext ctx{entry->config, model, cancel->get_token(), contamination};
                r.candidates = entry->detector->detect(*batch, ctx);
                r.status = DetectorStatus::SUCCESS;
            } catch (const ModelUnavailableError& e) {
                r.status = DetectorStatus::SKIPPED;
                r.message = e.what();
                utils::log::info(std::format("Detector '{}' skipped: {}", r.detector_name, e.what()));
            } catch (const std::exception& e) {
                r.status = DetectorStatus::FAILED;
                r.message = e.what();
                r.candidates.clear();
                utils::log::error(std::format("Detector '{}' failed: {}", r.detector_name, e.what()));
            } catch (...) {
                r.status = DetectorStatus::FAILED;
                r.message = "unknown exception";
                r.candidates.clear();
                utils::log::error(std::format("Detector '{}' failed: unknown exception",
                                              r.detector_name));
            }
            r.execution_time_ms = timer.elapsed_ms_f();
            return r;
        };

        pending.push_back({entry, cancel, pool_.submit(std::move(task))});
    }

    std::map<std::string, DetectorRunResult> results;
    const bool bounded = config_.detector_timeout.count() > 0;
    const auto deadline = dispatched_at + config_.detector_timeout;

    for (auto& p : pending) {
        const auto& name = p.entry->config.name;
        if (bounded && p.future.wait_until(deadline) == std::future_status::timeout) {
            p.cancel->request_stop();   // late result is discarded

            DetectorRunResult r;
            r.detector_name = name;
            r.detector_type = std::string(p.entry->detector->type());
            r.status = DetectorStatus::TIMED_OUT;
            r.execution_time_ms = static_cast<double>(config_.detector_timeout.count());
            r.message = std::format("exceeded detector timeout of {} ms",
                                    config_.detector_timeout.count());
            utils::log::warn(std::format("Detector '{}' timed out after {} ms",
                                         name, config_.detector_timeout.count()));
            results[name] = std::move(r);
            continue;
        }
        results[name] = p.future.get();
    }

    utils::log::debug(std::format("DetectorRegistry: {} detectors finished", results.size()));
    return results;
}

std::vector<DetectorPerformance> DetectorRegistry::performance_rows(
    const std::string& run_id,
    const std::map<std::string, DetectorRunResult>& results,
    size_t dataset_size) {

    std::vector<DetectorPerformance> rows;
    rows.reserve(results.size());
    const auto now = utils::now();
    for (const auto& [name, r] : results) {
        DetectorPerformance p;
        p.performance_id = utils::generate_uuid();
        p.run_id = run_id;
        p.detector_name = name;
        p.dataset_size = dataset_size;
        p.execution_time_ms = r.execution_time_ms;
        p.candidates_found = r.candidates.size();
        p.status = r.status;
        p.evaluated_at = now;
        rows.push_back(std::move(p));
    }
    return rows;
}

} // namespace auditfusion
