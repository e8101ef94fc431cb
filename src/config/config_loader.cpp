#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "detectors/detector_factory.hpp"

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace auditfusion {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars; arrays
 * (e.g. [[detectors]]) are concatenated.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir.empty() ? "." : base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key,
                                           std::vector<std::string> fallback) {
    const auto* arr = tbl[key].as_array();
    if (!arr) return fallback;

    std::vector<std::string> result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        if (const auto* s = elem.as_string()) {
            result.emplace_back(s->get());
        }
    }
    return result;
}

/**
 * @brief Convert a TOML node to JSON (detector params).
 * Dates and times become their TOML text form.
 */
nlohmann::json toml_to_json(const toml::node& node) {
    if (const auto* tbl = node.as_table()) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& [key, val] : *tbl) {
            obj[std::string(key.str())] = toml_to_json(val);
        }
        return obj;
    }
    if (const auto* arr = node.as_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& elem : *arr) {
            out.push_back(toml_to_json(elem));
        }
        return out;
    }
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* i = node.as_integer()) return i->get();
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* b = node.as_boolean()) return b->get();

    std::ostringstream oss;
    node.visit([&oss](const auto& v) { oss << v; });
    return oss.str();
}

// ---- Section extractors ----------------------------------------------------

void extract_engine(const toml::table& root, DetectionCoordinator::Config& cfg) {
    const auto* engine = root["engine"].as_table();
    if (!engine) return;
    const auto& e = *engine;

    const int64_t max_workers = e["max_workers"].value_or(int64_t{4});
    const int64_t max_batch_size = e["max_batch_size"].value_or(int64_t{0});
    const int64_t top_features = e["top_features"].value_or(int64_t{20});
    if (max_workers < 1) throw std::runtime_error("engine.max_workers must be >= 1");
    if (max_batch_size < 0) throw std::runtime_error("engine.max_batch_size must be >= 0");
    if (top_features < 0) throw std::runtime_error("engine.top_features must be >= 0");

    cfg.registry.max_workers = static_cast<size_t>(max_workers);
    cfg.registry.detector_timeout =
        std::chrono::milliseconds(e["detector_timeout_ms"].value_or(int64_t{0}));
    cfg.registry.contamination = e["contamination"].value_or(cfg.registry.contamination);
    cfg.max_batch_size = static_cast<size_t>(max_batch_size);
    cfg.fusion.min_confidence = e["min_confidence"].value_or(cfg.fusion.min_confidence);
    cfg.fusion.default_weight = e["default_weight"].value_or(cfg.fusion.default_weight);
    cfg.top_features = static_cast<size_t>(top_features);
}

void extract_features(const toml::table& root, FeatureBuilder::Config& cfg) {
    const auto* features = root["features"].as_table();
    if (!features) return;
    const auto& f = *features;

    cfg.id_field = f["id_field"].value_or(cfg.id_field);
    cfg.amount_keywords = toml_string_array(f, "amount_keywords", cfg.amount_keywords);
    cfg.date_keywords = toml_string_array(f, "date_keywords", cfg.date_keywords);
    cfg.unknown_token = f["unknown_token"].value_or(cfg.unknown_token);
}

void extract_severity(const toml::table& root, SeverityPolicy& cfg) {
    const auto* severity = root["severity"].as_table();
    if (!severity) return;
    const auto& s = *severity;

    cfg.critical_confidence = s["critical_confidence"].value_or(cfg.critical_confidence);
    cfg.critical_score = s["critical_score"].value_or(cfg.critical_score);
    cfg.high_confidence = s["high_confidence"].value_or(cfg.high_confidence);
    cfg.high_score = s["high_score"].value_or(cfg.high_score);
    cfg.medium_confidence = s["medium_confidence"].value_or(cfg.medium_confidence);
    cfg.medium_score = s["medium_score"].value_or(cfg.medium_score);
}

StoreConfig extract_store(const toml::table& root) {
    StoreConfig cfg;
    const auto* store = root["store"].as_table();
    if (!store) return cfg;
    const auto& s = *store;

    cfg.type = utils::to_lower(s["type"].value_or("memory"s));
    cfg.directory = s["directory"].value_or(""s);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = utils::to_lower((*logging)["level"].value_or("info"s));
    return cfg;
}

std::vector<ModelFileConfig> extract_models(const toml::table& root) {
    std::vector<ModelFileConfig> result;
    const auto* arr = root["models"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* m = elem.as_table();
        if (!m) continue;
        ModelFileConfig cfg;
        cfg.detector = (*m)["detector"].value_or(""s);
        cfg.path = (*m)["path"].value_or(""s);
        result.emplace_back(std::move(cfg));
    }
    return result;
}

std::vector<DetectorConfig> extract_detectors(const toml::table& root) {
    std::vector<DetectorConfig> result;
    const auto* arr = root["detectors"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* d = elem.as_table();
        if (!d) continue;

        DetectorConfig cfg;
        cfg.name = (*d)["name"].value_or(""s);
        cfg.type = (*d)["type"].value_or(cfg.name);
        cfg.enabled = (*d)["enabled"].value_or(true);
        cfg.weight = (*d)["weight"].value_or(1.0);
        cfg.threshold = (*d)["threshold"].value_or(0.5);
        if (const auto* params = (*d)["params"].as_table()) {
            cfg.params = toml_to_json(*params);
        }
        result.emplace_back(std::move(cfg));
    }
    return result;
}

EngineConfig extract_all_sections(const toml::table& tbl) {
    EngineConfig config;
    extract_engine(tbl, config.engine);
    extract_features(tbl, config.engine.features);
    extract_severity(tbl, config.engine.fusion.severity);
    config.store = extract_store(tbl);
    config.logging = extract_logging(tbl);
    config.models = extract_models(tbl);
    config.detectors = extract_detectors(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;
    const auto& engine = config.engine;

    if (engine.registry.max_workers < 1) {
        errors.push_back("engine.max_workers must be >= 1");
    }
    if (engine.registry.detector_timeout.count() < 0) {
        errors.push_back("engine.detector_timeout_ms must be >= 0");
    }
    if (!(engine.registry.contamination > 0.0 && engine.registry.contamination <= 0.5)) {
        errors.push_back(std::format("engine.contamination must be in (0, 0.5], got {}",
                                     engine.registry.contamination));
    }
    if (!(engine.fusion.min_confidence >= 0.0 && engine.fusion.min_confidence <= 1.0)) {
        errors.push_back(std::format("engine.min_confidence must be in [0, 1], got {}",
                                     engine.fusion.min_confidence));
    }
    if (const auto problem = engine.fusion.severity.validate(); !problem.empty()) {
        errors.push_back("severity: " + problem);
    }
    if (engine.features.id_field.empty()) {
        errors.push_back("features.id_field must not be empty");
    }

    if (config.store.type != "memory" && config.store.type != "jsonl") {
        errors.push_back(std::format("store.type must be 'memory' or 'jsonl', got '{}'",
                                     config.store.type));
    }
    if (config.store.type == "jsonl" && config.store.directory.empty()) {
        errors.push_back("store.directory required when store.type is 'jsonl'");
    }

    static const std::unordered_set<std::string> levels = {"debug", "info", "warn", "error"};
    if (!levels.contains(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < config.detectors.size(); ++i) {
        const auto& d = config.detectors[i];
        if (d.name.empty()) {
            errors.push_back(std::format("detectors[{}].name must not be empty", i));
        } else if (!names.insert(d.name).second) {
            errors.push_back(std::format("detectors[{}].name '{}' is duplicated", i, d.name));
        }
        if (!DetectorFactory::instance().has_type(d.type)) {
            errors.push_back(std::format("detectors[{}].type '{}' is not a known detector type",
                                         i, d.type));
        }
        if (!std::isfinite(d.weight) || d.weight < 0.0) {
            errors.push_back(std::format("detectors[{}].weight must be >= 0", i));
        }
    }

    for (size_t i = 0; i < config.models.size(); ++i) {
        const auto& m = config.models[i];
        if (m.detector.empty()) {
            errors.push_back(std::format("models[{}].detector must not be empty", i));
        }
        if (m.path.empty()) {
            errors.push_back(std::format("models[{}].path must not be empty", i));
        }
    }

    return errors;
}

} // namespace auditfusion
