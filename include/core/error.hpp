#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sqlanon {

/**
 * @brief Error categories for the anonymizer
 */
enum class ErrorCategory {
    USAGE_ERROR,
    CONFIGURATION_ERROR,
    STRATEGY_ERROR,
    EXECUTION_ERROR
};

[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::USAGE_ERROR:         return "usage";
        case ErrorCategory::CONFIGURATION_ERROR: return "configuration";
        case ErrorCategory::STRATEGY_ERROR:      return "strategy";
        case ErrorCategory::EXECUTION_ERROR:     return "execution";
    }
    return "unknown";
}

/**
 * @brief Base class of every error raised by the anonymization core
 */
class AnonymizerError : public std::runtime_error {
public:
    AnonymizerError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Caller misuse: conflicting filters, malformed selectors, unknown
 * anonymizer identifiers. Always raised before any database mutation.
 */
class UsageError : public AnonymizerError {
public:
    explicit UsageError(const std::string& message)
        : AnonymizerError(ErrorCategory::USAGE_ERROR, message) {}
};

class UnknownAnonymizerKind : public UsageError {
public:
    explicit UnknownAnonymizerKind(const std::string& kind)
        : UsageError("Unknown anonymizer: \"" + kind + "\""), kind_(kind) {}

    [[nodiscard]] const std::string& kind() const noexcept { return kind_; }

private:
    std::string kind_;
};

/**
 * @brief Anonymization rules could not be loaded or are invalid
 */
class ConfigurationError : public AnonymizerError {
public:
    explicit ConfigurationError(const std::string& message)
        : AnonymizerError(ErrorCategory::CONFIGURATION_ERROR, message) {}
};

/**
 * @brief A strategy failed in initialize(), anonymize() or clean(), or a
 * registered factory broke the strategy contract
 */
class StrategyLifecycleError : public AnonymizerError {
public:
    explicit StrategyLifecycleError(const std::string& message)
        : AnonymizerError(ErrorCategory::STRATEGY_ERROR, message) {}
};

/**
 * @brief A statement sent to the database failed
 */
class ExecutionError : public AnonymizerError {
public:
    explicit ExecutionError(const std::string& message)
        : AnonymizerError(ErrorCategory::EXECUTION_ERROR, message) {}
};

} // namespace sqlanon
