// =================================================================
// include/OpenBerl/RetryExecutor.hpp
// =================================================================
// Retry loop with exponential backoff and a single fallback attempt.

#pragma once

#include "OpenBerl/UmfMessage.hpp"
#include "OpenBerl/Errors.hpp"
#include <functional>
#include <chrono>
#include <string>

namespace OpenBerl {

/**
 * @brief Per-attempt options handed to the adapter's backend call
 */
struct AttemptOptions {
    size_t attempt = 0;         ///< Zero-based attempt number
    bool use_fallback = false;  ///< Route this attempt to the fallback model
};

/**
 * @brief Runs a backend call under a request's retry policy
 *
 * Retryable AdapterErrors (transient, rate limited, timeout) are retried up to
 * max_retries times, waiting backoff_factor^attempt seconds between attempts
 * (twice that when rate limited, at most MAX_BACKOFF). Terminal errors and any other exception
 * propagate at once. When retries are exhausted and a fallback is available,
 * one more attempt runs with use_fallback set.
 */
class RetryExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Attempt = std::function<UmfResponse(const AttemptOptions&)>;

    /// Upper bound on a single wait between attempts
    static constexpr std::chrono::milliseconds MAX_BACKOFF{300000};

    /**
     * @param sleeper Called to wait between attempts; defaults to std::this_thread::sleep_for
     */
    explicit RetryExecutor(Sleeper sleeper = Sleeper());

    /**
     * @brief Run an attempt function until it succeeds or the policy gives up
     * @param policy Retry count and backoff factor
     * @param has_fallback Whether a fallback attempt is possible after exhaustion
     * @param attempt The backend call
     * @param component Name used in retry log lines
     * @return The first successful response
     * @throws AdapterError or whatever the last attempt threw
     */
    UmfResponse run(const RetryPolicy& policy,
                    bool has_fallback,
                    const Attempt& attempt,
                    const std::string& component = "RetryExecutor") const;

    /**
     * @brief Wait before the next attempt
     * @param policy Retry policy supplying the backoff factor
     * @param attempt Zero-based number of the attempt that just failed
     * @param kind Classification of the failure
     * @return The wait, clamped to [0, MAX_BACKOFF]
     */
    static std::chrono::milliseconds computeBackoff(const RetryPolicy& policy,
                                                    size_t attempt,
                                                    ErrorKind kind);

    void setSleeper(Sleeper sleeper);

private:
    Sleeper m_sleeper;
};

} // namespace OpenBerl
