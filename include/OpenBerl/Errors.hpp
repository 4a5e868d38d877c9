// =================================================================
// include/OpenBerl/Errors.hpp
// =================================================================
// Exception types for pipeline configuration, routing and adapter failures.

#pragma once

#include <stdexcept>
#include <string>

namespace OpenBerl {

/**
 * @brief Invalid pipeline or adapter configuration (empty pipeline, bad task type, ...)
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief No adapter (or no healthy, authorized adapter) can serve a task type
 */
class RoutingError : public std::runtime_error {
public:
    explicit RoutingError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Malformed request data or credentials
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Classification of a failed backend attempt
 */
enum class ErrorKind {
    TRANSIENT,      ///< Server-side failure (5xx), worth retrying
    RATE_LIMITED,   ///< Backend asked us to slow down (429)
    TIMEOUT,        ///< Call exceeded the request timeout
    TERMINAL        ///< Auth failure, bad request, anything not worth retrying
};

/**
 * @brief Get a display name for an error kind
 */
inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSIENT: return "transient";
        case ErrorKind::RATE_LIMITED: return "rate_limited";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::TERMINAL: return "terminal";
    }
    return "unknown";
}

/**
 * @brief Failure raised by an adapter while talking to its backend
 */
class AdapterError : public std::runtime_error {
public:
    AdapterError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

    bool isRetryable() const { return m_kind != ErrorKind::TERMINAL; }

private:
    ErrorKind m_kind;
};

} // namespace OpenBerl
