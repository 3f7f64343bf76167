#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace anonymizer {

/**
 * @brief Error categories for recoverable failures at the edges
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    IO_ERROR,
    PARSE_ERROR,
    POLICY_ERROR,
    INTERNAL_ERROR
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

/**
 * @brief Irreversible mode requested without a secret
 *
 * Thrown from the pipeline constructor; no transformation can run.
 */
class MissingSecretError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Technique name outside the registry
 */
class UnsupportedTechniqueError : public std::invalid_argument {
public:
    explicit UnsupportedTechniqueError(const std::string& technique)
        : std::invalid_argument("Unsupported technique: " + technique),
          technique_(technique) {}

    const std::string& technique() const { return technique_; }

private:
    std::string technique_;
};

} // namespace anonymizer
