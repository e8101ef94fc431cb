#pragma once

#include <string>
#include <stdexcept>
#include <optional>

namespace auditfusion {

/**
 * @brief Error categories for the detection engine
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR,
    FEATURE_EXTRACTION_ERROR,
    DETECTOR_EXECUTION_ERROR,
    MODEL_UNAVAILABLE,
    PERSISTENCE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                     return "none";
        case ErrorCategory::CONFIGURATION_ERROR:      return "configuration_error";
        case ErrorCategory::FEATURE_EXTRACTION_ERROR: return "feature_extraction_error";
        case ErrorCategory::DETECTOR_EXECUTION_ERROR: return "detector_execution_error";
        case ErrorCategory::MODEL_UNAVAILABLE:        return "model_unavailable";
        case ErrorCategory::PERSISTENCE_ERROR:        return "persistence_error";
        case ErrorCategory::INTERNAL_ERROR:           return "internal_error";
        default:                                      return "unknown";
    }
}

// ============================================================================
// Typed exceptions (converted to ErrorCategory at the coordinator boundary)
// ============================================================================

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/// Bad or missing detector configuration; aborts the run before any detector executes.
class ConfigurationError : public EngineError {
public:
    explicit ConfigurationError(const std::string& message)
        : EngineError(ErrorCategory::CONFIGURATION_ERROR, message) {}
};

/// Malformed batch; aborts the run.
class FeatureExtractionError : public EngineError {
public:
    explicit FeatureExtractionError(const std::string& message)
        : EngineError(ErrorCategory::FEATURE_EXTRACTION_ERROR, message) {}
};

/// A detector needs a fitted model that is not registered. Means "skipped".
class ModelUnavailableError : public EngineError {
public:
    explicit ModelUnavailableError(const std::string& message)
        : EngineError(ErrorCategory::MODEL_UNAVAILABLE, message) {}
};

/// Result Store write or read failure.
class PersistenceError : public EngineError {
public:
    explicit PersistenceError(const std::string& message)
        : EngineError(ErrorCategory::PERSISTENCE_ERROR, message) {}
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace auditfusion
