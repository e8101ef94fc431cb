#include "config/config_loader.hpp"
#include "coordinator/detection_coordinator.hpp"
#include "core/signal_watcher.hpp"
#include "core/utils.hpp"
#include "serialization/json_codec.hpp"
#include "store/jsonl_result_store.hpp"
#include "store/memory_result_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <stop_token>

using namespace auditfusion;

namespace {

struct CliOptions {
    std::string config_file;
    std::string input_file = "-";
    std::string output_file;
    std::string run_config_file;
    RunConfig run;
    bool show_help = false;
};

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [options]\n"
        "  --config <file>          engine.toml (defaults built in when omitted)\n"
        "  --input <file>           JSON records: array or {{table: [rows]}} (- = stdin)\n"
        "  --output <file>          write the report here instead of stdout\n"
        "  --run-config <file>      JSON run config\n"
        "  --detectors <a,b,...>    run only these detectors\n"
        "  --no-ensemble            union mode instead of weighted fusion\n"
        "  --min-confidence <x>     override the fusion threshold for this run\n"
        "  --no-importance          skip feature importance\n"
        "  --no-persist             do not write to the result store\n"
        "  --help\n", prog);
}

/// @throws std::invalid_argument on a malformed command line
CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> explicit_detectors;
    std::optional<double> explicit_min_confidence;
    bool no_ensemble = false;
    bool no_importance = false;
    bool no_persist = false;

    const auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::format("{} requires a value", flag));
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (arg == "--config") {
            opts.config_file = next_value(i, arg);
        } else if (arg == "--input") {
            opts.input_file = next_value(i, arg);
        } else if (arg == "--output") {
            opts.output_file = next_value(i, arg);
        } else if (arg == "--run-config") {
            opts.run_config_file = next_value(i, arg);
        } else if (arg == "--detectors") {
            for (auto& name : utils::split(next_value(i, arg), ',')) {
                name = utils::trim(name);
                if (!name.empty()) explicit_detectors.push_back(std::move(name));
            }
        } else if (arg == "--no-ensemble") {
            no_ensemble = true;
        } else if (arg == "--min-confidence") {
            const auto value = next_value(i, arg);
            try {
                explicit_min_confidence = std::stod(value);
            } catch (const std::exception&) {
                throw std::invalid_argument(
                    std::format("--min-confidence expects a number, got '{}'", value));
            }
        } else if (arg == "--no-importance") {
            no_importance = true;
        } else if (arg == "--no-persist") {
            no_persist = true;
        } else {
            throw std::invalid_argument(std::format("unknown option '{}'", arg));
        }
    }

    // Run-config file first; command-line flags override it
    if (!opts.run_config_file.empty()) {
        std::ifstream in(opts.run_config_file);
        if (!in) {
            throw std::invalid_argument(
                std::format("cannot open run config {}", opts.run_config_file));
        }
        opts.run = codec::run_config_from_json(nlohmann::json::parse(in));
    }
    if (!explicit_detectors.empty()) opts.run.detectors = std::move(explicit_detectors);
    if (explicit_min_confidence) opts.run.min_confidence = explicit_min_confidence;
    if (no_ensemble) opts.run.use_ensemble = false;
    if (no_importance) opts.run.analyze_feature_importance = false;
    if (no_persist) opts.run.persist = false;
    return opts;
}

std::string read_input(const std::string& path) {
    if (path == "-") {
        return {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    }
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::format("cannot open input {}", path));
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::shared_ptr<IResultStore> make_store(const StoreConfig& cfg) {
    if (cfg.type == "jsonl") {
        return std::make_shared<JsonlResultStore>(cfg.directory);
    }
    return std::make_shared<MemoryResultStore>();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << std::format("error: {}\n", e.what());
        print_usage(argv[0]);
        return 2;
    }
    if (opts.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        // Signals only set a flag; the watcher thread cancels the run
        std::stop_source cancel;
        SignalWatcher watcher(cancel);
        SignalWatcher::install();

        // [1/4] Configuration
        EngineConfig config;
        if (!opts.config_file.empty()) {
            utils::log::info(std::format("[1/4] Loading configuration from {}", opts.config_file));
            auto loaded = ConfigLoader::load_from_file(opts.config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 2;
            }
            config = std::move(loaded.config);
        } else {
            utils::log::info("[1/4] No config file given, using built-in defaults");
        }
        utils::log::set_level(config.logging.level);

        // [2/4] Result store and fitted models
        utils::log::info(std::format("[2/4] Result store: {}", config.store.type));
        auto store = make_store(config.store);
        auto models = std::make_shared<ModelRegistry>();
        for (const auto& m : config.models) {
            auto loaded = models->load_classifier(m.detector, m.path);
            if (loaded.is_error()) {
                // The detector reports itself as skipped for this run
                utils::log::warn(std::format("Model for {} not loaded: {}",
                                             m.detector, loaded.error_message()));
            }
        }

        DetectionCoordinator coordinator(config.engine, config.detectors, store, models);

        // [3/4] Input
        utils::log::info(std::format("[3/4] Reading records from {}",
            opts.input_file == "-" ? "stdin" : opts.input_file));
        std::vector<Record> records;
        try {
            records = codec::parse_records(read_input(opts.input_file));
        } catch (const FeatureExtractionError& e) {
            utils::log::error(std::format("Invalid input: {}", e.what()));
            return 2;
        }

        // [4/4] Detection
        utils::log::info("[4/4] Running detection");
        const auto report = coordinator.detect_anomalies(records, opts.run, cancel.get_token());
        const auto doc = codec::report_to_json(report).dump(2);

        if (opts.output_file.empty()) {
            std::cout << doc << '\n';
        } else {
            std::ofstream out(opts.output_file);
            if (!out) {
                utils::log::error(std::format("cannot write report to {}", opts.output_file));
                return 1;
            }
            out << doc << '\n';
        }

        switch (report.status) {
            case RunStatus::SUCCESS:
            case RunStatus::DEGRADED:
                return 0;
            case RunStatus::CANCELLED:
                return 130;
            case RunStatus::ERROR:
                return 1;
        }
        return 1;
    } catch (const EngineError& e) {
        utils::log::error(std::format("{}: {}", error_category_to_string(e.category()), e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
