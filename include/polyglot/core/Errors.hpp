#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace polyglot::core {

class LanguageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised for settings that make an operation impossible: empty language id,
// no file to save to, a persistence format without an engine.
class ConfigurationError : public LanguageError {
public:
    using LanguageError::LanguageError;
};

enum class FailureKind {
    None,
    Configuration,
    Domain,
};

/**
 * @brief Outcome of an engine load or save.
 *
 * Domain failures are recoverable conditions such as a missing language file.
 * I/O and parse failures are not reported here; they propagate as exceptions.
 */
struct OperationResult {
    FailureKind failure{FailureKind::None};
    std::string message;

    [[nodiscard]] bool succeeded() const noexcept { return failure == FailureKind::None; }

    static OperationResult ok() { return {}; }
    static OperationResult domain(std::string message) { return {FailureKind::Domain, std::move(message)}; }
    static OperationResult configuration(std::string message) {
        return {FailureKind::Configuration, std::move(message)};
    }
};

} // namespace polyglot::core
