#pragma once

#include "core/error.hpp"
#include "detectors/detector_factory.hpp"
#include "detectors/idetector.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace auditfusion::testing {

/**
 * @brief Scriptable detector for registry and coordinator tests.
 *
 * params:
 *   mode        "flag" (default), "throw", "throw_value", "skip", "slow"
 *   ids         record ids to flag (empty = every record)
 *   confidence  candidate confidence (default 0.9)
 *   anomaly     anomaly type name (default "statistical")
 *   delay_ms    "slow" mode sleep, cut short by the stop token
 */
class MockDetector : public IDetector {
public:
    explicit MockDetector(const DetectorConfig& config)
        : name_(config.name),
          mode_(config.param<std::string>("mode", "flag")),
          confidence_(config.param<double>("confidence", 0.9)),
          delay_(config.param<int64_t>("delay_ms", 0)) {
        if (config.params.contains("ids")) {
            for (const auto& id : config.params.at("ids")) ids_.insert(id.get<std::string>());
        }
        anomaly_ = anomaly_type_from_string(config.param<std::string>("anomaly", "statistical"))
                       .value_or(AnomalyType::STATISTICAL);
    }

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string_view type() const override { return "mock"; }

    [[nodiscard]] std::vector<AnomalyCandidate> detect(
        const FeatureBatch& batch, const DetectionContext& ctx) const override {
        calls().fetch_add(1, std::memory_order_relaxed);

        if (mode_ == "throw") throw std::runtime_error("mock detector exploded");
        if (mode_ == "throw_value") throw 42;
        if (mode_ == "skip") throw ModelUnavailableError("mock model missing");
        if (mode_ == "slow") {
            const auto until = std::chrono::steady_clock::now() + delay_;
            while (std::chrono::steady_clock::now() < until && !ctx.stop.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            if (ctx.stop.stop_requested()) return {};
        }

        std::vector<AnomalyCandidate> out;
        for (const auto& fv : batch.vectors) {
            if (!ids_.empty() && !ids_.contains(fv.record_id)) continue;
            AnomalyCandidate c;
            c.record_id = fv.record_id;
            c.record_index = fv.record_index;
            c.detector_name = name_;
            c.raw_score = confidence_;
            c.confidence = confidence_;
            c.anomaly_type = anomaly_;
            c.explanation = name_ + " says so";
            out.push_back(std::move(c));
        }
        return out;
    }

    static std::atomic<int>& calls() {
        static std::atomic<int> counter{0};
        return counter;
    }

    static void register_type() {
        DetectorFactory::instance().register_type("mock", [](const DetectorConfig& c) {
            return std::make_unique<MockDetector>(c);
        });
    }

private:
    std::string name_;
    std::string mode_;
    double confidence_;
    std::chrono::milliseconds delay_;
    std::set<std::string> ids_;
    AnomalyType anomaly_ = AnomalyType::STATISTICAL;
};

[[nodiscard]] inline DetectorConfig mock_config(const std::string& name,
                                                nlohmann::json params = nlohmann::json::object(),
                                                double weight = 1.0) {
    MockDetector::register_type();
    DetectorConfig cfg;
    cfg.name = name;
    cfg.type = "mock";
    cfg.weight = weight;
    cfg.params = params.is_null() ? nlohmann::json::object() : std::move(params);
    return cfg;
}

} // namespace auditfusion::testing
