#pragma once

#include <string>
#include <stdexcept>
#include <optional>

namespace docanon {

/**
 * @brief Error categories for the anonymizer
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    UNSUPPORTED_FORMAT,
    PARSE_ERROR,
    REGISTRY_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:               return "none";
        case ErrorCategory::CONFIG_ERROR:       return "config_error";
        case ErrorCategory::UNSUPPORTED_FORMAT: return "unsupported_format";
        case ErrorCategory::PARSE_ERROR:        return "parse_error";
        case ErrorCategory::REGISTRY_ERROR:     return "registry_error";
        case ErrorCategory::INTERNAL_ERROR:     return "internal_error";
    }
    return "unknown";
}

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

// ============================================================================
// Exceptions thrown across construction/configuration boundaries
// ============================================================================

/** Missing or invalid configuration (e.g. secret key not set). */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** Input file has an extension no format adapter handles. */
class UnsupportedFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** A container could not be parsed or rebuilt. */
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** A registry statement failed; the message carries the backend error. */
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace docanon
