#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include "../common/RetryManager.hpp"
#include "../config/AppConfig.hpp"
#include "../storage/ObjectStore.hpp"

namespace Scribe {

enum class HealthTag {
    Ok,
    IncompleteConfig,
    AuthFailed,
    BucketMissing,
    NetworkError,
    Timeout,
    ServerError
};

struct Health {
    bool reachable = false;
    QString reason;
    HealthTag tag = HealthTag::NetworkError;

    QJsonObject toJson() const;
};

QString healthTagName(HealthTag tag);

/**
 * @brief Verifies the object store is reachable and the bucket accessible
 *
 * Issues a one-key listing of the bucket. Transient failures are retried
 * with backoff; credential and bucket errors are reported immediately.
 */
class ConnectivityChecker {
public:
    explicit ConnectivityChecker(ObjectStoreFactory factory,
                                 RetryConfig retryConfig = RetryConfigs::connectivity());

    Health check(const AppConfig& config) const;

    static HealthTag tagFor(StoreError error);

private:
    ObjectStoreFactory factory_;
    RetryConfig retryConfig_;
};

} // namespace Scribe
