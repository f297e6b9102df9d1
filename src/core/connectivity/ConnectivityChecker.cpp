#include "ConnectivityChecker.hpp"
#include "../common/Logger.hpp"

namespace Scribe {

QString healthTagName(HealthTag tag) {
    switch (tag) {
        case HealthTag::Ok: return QStringLiteral("Ok");
        case HealthTag::IncompleteConfig: return QStringLiteral("IncompleteConfig");
        case HealthTag::AuthFailed: return QStringLiteral("AuthFailed");
        case HealthTag::BucketMissing: return QStringLiteral("BucketMissing");
        case HealthTag::NetworkError: return QStringLiteral("NetworkError");
        case HealthTag::Timeout: return QStringLiteral("Timeout");
        case HealthTag::ServerError: return QStringLiteral("ServerError");
    }
    return QStringLiteral("NetworkError");
}

QJsonObject Health::toJson() const {
    QJsonObject json;
    json["reachable"] = reachable;
    json["reason"] = reason;
    json["tag"] = healthTagName(tag);
    return json;
}

ConnectivityChecker::ConnectivityChecker(ObjectStoreFactory factory, RetryConfig retryConfig)
    : factory_(std::move(factory))
    , retryConfig_(retryConfig) {
}

HealthTag ConnectivityChecker::tagFor(StoreError error) {
    switch (error) {
        case StoreError::IncompleteConfig: return HealthTag::IncompleteConfig;
        case StoreError::AuthFailed: return HealthTag::AuthFailed;
        case StoreError::BucketMissing: return HealthTag::BucketMissing;
        case StoreError::NotFound: return HealthTag::BucketMissing;
        case StoreError::Timeout: return HealthTag::Timeout;
        case StoreError::ServerError: return HealthTag::ServerError;
        case StoreError::InvalidResponse: return HealthTag::ServerError;
        case StoreError::NetworkError:
        case StoreError::FileSystemError:
            break;
    }
    return HealthTag::NetworkError;
}

Health ConnectivityChecker::check(const AppConfig& config) const {
    if (!config.minio.isComplete()) {
        return Health{false, QStringLiteral("MinIO config is incomplete"), HealthTag::IncompleteConfig};
    }

    auto store = factory_(config.minio);
    if (!store) {
        return Health{false, QStringLiteral("No object store available"), HealthTag::NetworkError};
    }

    RetryManager retry(retryConfig_);
    auto outcome = retry.execute<ObjectListing, StoreFailure>(
        [&store]() { return store->listObjects(QString(), QString(), 1); },
        [](const StoreFailure& failure) { return isTransientStoreError(failure.kind); });

    if (outcome.hasValue()) {
        SCRIBE_INFO("Object store {} reachable, bucket '{}' accessible",
                    config.minio.url.toStdString(), config.minio.bucket.toStdString());
        return Health{true, QString(), HealthTag::Ok};
    }

    const auto& failure = outcome.error();
    Health health{false, describeFailure(failure.lastError), tagFor(failure.lastError.kind)};
    if (failure.reason == RetryError::TimeoutExceeded && failure.attempts == 0) {
        health.tag = HealthTag::Timeout;
        health.reason = QStringLiteral("Connectivity check timed out");
    }

    SCRIBE_WARN("Object store check failed after {} attempt(s): {} ({})",
                failure.attempts, health.reason.toStdString(), healthTagName(health.tag).toStdString());
    return health;
}

} // namespace Scribe
