// =================================================================
// src/OpenBerl/RetryExecutor.cpp
// =================================================================
// Implementation of the retry loop.

#include "OpenBerl/RetryExecutor.hpp"
#include "OpenBerl/Logger.hpp"
#include <cmath>
#include <thread>

namespace OpenBerl {

RetryExecutor::RetryExecutor(Sleeper sleeper)
    : m_sleeper(std::move(sleeper)) {
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

UmfResponse RetryExecutor::run(const RetryPolicy& policy,
                               bool has_fallback,
                               const Attempt& attempt,
                               const std::string& component) const {
    AttemptOptions options;

    for (size_t i = 0; i <= policy.max_retries; ++i) {
        options.attempt = i;
        try {
            return attempt(options);
        } catch (const AdapterError& e) {
            if (!e.isRetryable()) {
                throw;
            }

            if (i == policy.max_retries) {
                if (!has_fallback) {
                    throw;
                }
                Logger::getInstance().warning(component,
                    "Retries exhausted, switching to fallback model", e.what());
                break;
            }

            auto delay = computeBackoff(policy, i, e.kind());
            Logger::getInstance().logRetry(component, i + 1, policy.max_retries,
                                           errorKindToString(e.kind()), delay.count());
            m_sleeper(delay);
        }
    }

    options.attempt = policy.max_retries + 1;
    options.use_fallback = true;
    return attempt(options);
}

std::chrono::milliseconds RetryExecutor::computeBackoff(const RetryPolicy& policy,
                                                        size_t attempt,
                                                        ErrorKind kind) {
    double seconds = std::pow(policy.backoff_factor, static_cast<double>(attempt));
    if (kind == ErrorKind::RATE_LIMITED) {
        seconds *= 2.0;
    }

    // Also catches NaN
    if (!(seconds > 0.0)) {
        return std::chrono::milliseconds(0);
    }
    if (seconds * 1000.0 >= static_cast<double>(MAX_BACKOFF.count())) {
        return MAX_BACKOFF;
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

void RetryExecutor::setSleeper(Sleeper sleeper) {
    if (sleeper) {
        m_sleeper = std::move(sleeper);
    }
}

} // namespace OpenBerl
