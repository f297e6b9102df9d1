#pragma once

#include <QtCore/QElapsedTimer>
#include <QtCore/QThread>
#include <chrono>
#include <functional>
#include "Expected.hpp"

namespace Scribe {

enum class RetryPolicy {
    None,           // No delay between attempts
    Linear,         // Fixed delay between retries
    Exponential     // Exponentially increasing delay
};

enum class RetryError {
    MaxAttemptsExceeded,
    TimeoutExceeded,
    NonRetryableError
};

struct RetryConfig {
    RetryPolicy policy = RetryPolicy::Exponential;
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    std::chrono::milliseconds timeout{0}; // 0 = no timeout
    double backoffMultiplier = 2.0;
    double jitterFactor = 0.1; // 10% jitter
    bool enableJitter = true;
};

// Why a retried operation gave up, together with the error of the last attempt.
template<typename ErrorType>
struct RetryFailure {
    RetryError reason;
    ErrorType lastError;
    int attempts = 0;
};

/**
 * @brief Blocking retry loop with configurable backoff
 *
 * Runs on the caller's thread; the delay between attempts sleeps that thread.
 * Used for object-store requests where transient network errors are expected.
 */
class RetryManager {
public:
    explicit RetryManager(const RetryConfig& config = RetryConfig());

    template<typename T, typename ErrorType>
    Expected<T, RetryFailure<ErrorType>> execute(
        std::function<Expected<T, ErrorType>()> operation,
        std::function<bool(const ErrorType&)> isRetryable = nullptr
    );

    std::chrono::milliseconds calculateDelayForAttempt(int attempt) const;

private:
    bool timedOut(const QElapsedTimer& elapsed) const;
    void logAttemptFailure(int attempt, std::chrono::milliseconds delay) const;

    RetryConfig config_;
};

template<typename T, typename ErrorType>
Expected<T, RetryFailure<ErrorType>> RetryManager::execute(
    std::function<Expected<T, ErrorType>()> operation,
    std::function<bool(const ErrorType&)> isRetryable
) {
    QElapsedTimer elapsed;
    elapsed.start();

    const int maxAttempts = config_.maxAttempts > 0 ? config_.maxAttempts : 1;
    ErrorType lastError{};

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (timedOut(elapsed)) {
            return makeUnexpected(RetryFailure<ErrorType>{RetryError::TimeoutExceeded, lastError, attempt - 1});
        }

        auto result = operation();
        if (result.hasValue()) {
            return Expected<T, RetryFailure<ErrorType>>(std::move(result).value());
        }

        lastError = result.error();

        if (isRetryable && !isRetryable(lastError)) {
            return makeUnexpected(RetryFailure<ErrorType>{RetryError::NonRetryableError, lastError, attempt});
        }

        // Don't delay after the last attempt
        if (attempt < maxAttempts) {
            auto delay = calculateDelayForAttempt(attempt);
            logAttemptFailure(attempt, delay);
            QThread::msleep(static_cast<unsigned long>(delay.count()));
        }
    }

    return makeUnexpected(RetryFailure<ErrorType>{RetryError::MaxAttemptsExceeded, lastError, maxAttempts});
}

namespace RetryConfigs {
    inline RetryConfig network() {
        RetryConfig config;
        config.policy = RetryPolicy::Exponential;
        config.maxAttempts = 4;
        config.initialDelay = std::chrono::milliseconds(500);
        config.maxDelay = std::chrono::milliseconds(8000);
        config.timeout = std::chrono::milliseconds(120000);
        config.backoffMultiplier = 2.0;
        config.enableJitter = true;
        return config;
    }

    // Few quick attempts for health checks issued from interactive requests.
    inline RetryConfig connectivity() {
        RetryConfig config;
        config.policy = RetryPolicy::Exponential;
        config.maxAttempts = 3;
        config.initialDelay = std::chrono::milliseconds(250);
        config.maxDelay = std::chrono::milliseconds(2000);
        config.timeout = std::chrono::milliseconds(30000);
        config.backoffMultiplier = 2.0;
        config.enableJitter = true;
        return config;
    }
}

} // namespace Scribe
