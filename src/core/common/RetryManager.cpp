#include "RetryManager.hpp"
#include "Logger.hpp"
#include <QtCore/QRandomGenerator>
#include <algorithm>
#include <cmath>

namespace Scribe {

RetryManager::RetryManager(const RetryConfig& config)
    : config_(config) {
}

std::chrono::milliseconds RetryManager::calculateDelayForAttempt(int attempt) const {
    std::chrono::milliseconds delay{0};

    switch (config_.policy) {
        case RetryPolicy::None:
            break;

        case RetryPolicy::Linear:
            delay = config_.initialDelay;
            break;

        case RetryPolicy::Exponential: {
            double multiplier = std::pow(config_.backoffMultiplier, std::max(0, attempt - 1));
            delay = std::chrono::milliseconds(
                static_cast<long long>(config_.initialDelay.count() * multiplier)
            );
            break;
        }
    }

    if (config_.enableJitter && config_.jitterFactor > 0.0) {
        double jitterRange = delay.count() * config_.jitterFactor;
        double jitter = (QRandomGenerator::global()->generateDouble() - 0.5) * 2.0 * jitterRange;
        delay = std::chrono::milliseconds(
            static_cast<long long>(std::max(0.0, delay.count() + jitter))
        );
    }

    if (delay > config_.maxDelay) {
        delay = config_.maxDelay;
    }

    return delay;
}

bool RetryManager::timedOut(const QElapsedTimer& elapsed) const {
    return config_.timeout.count() > 0 && elapsed.elapsed() > config_.timeout.count();
}

void RetryManager::logAttemptFailure(int attempt, std::chrono::milliseconds delay) const {
    SCRIBE_WARN("Attempt {}/{} failed, retrying in {}ms",
                attempt, config_.maxAttempts, static_cast<long long>(delay.count()));
}

} // namespace Scribe
