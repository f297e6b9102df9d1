#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QtGlobal>
#include <functional>
#include <memory>
#include "../common/Expected.hpp"
#include "../config/AppConfig.hpp"

namespace Scribe {

enum class StoreError {
    IncompleteConfig,
    NetworkError,
    Timeout,
    AuthFailed,
    BucketMissing,
    NotFound,
    ServerError,
    InvalidResponse,
    FileSystemError
};

struct StoreFailure {
    StoreError kind = StoreError::NetworkError;
    int httpStatus = 0;
    QString message;
};

struct ObjectListing {
    QStringList keys;
    QStringList commonPrefixes;
};

/**
 * @brief Minimal S3-compatible object store surface
 *
 * Implementations must be callable from any thread; each call blocks the
 * calling thread until it completes, fails or times out.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Lists keys and delimiter prefixes under prefix. Follows continuation
    // tokens unless maxKeys > 0, in which case a single page is fetched.
    virtual Expected<ObjectListing, StoreFailure> listObjects(const QString& prefix,
                                                              const QString& delimiter = QString(),
                                                              int maxKeys = 0) = 0;

    // Streams the object to destinationPath. Returns the number of bytes written.
    virtual Expected<qint64, StoreFailure> download(const QString& key,
                                                    const QString& destinationPath) = 0;
};

using ObjectStoreFactory = std::function<std::unique_ptr<ObjectStore>(const MinioSettings&)>;

QString storeErrorName(StoreError error);

// Network, timeout and 5xx failures may succeed on a later attempt.
bool isTransientStoreError(StoreError error);

inline QString describeFailure(const StoreFailure& failure) {
    return failure.message.isEmpty() ? storeErrorName(failure.kind) : failure.message;
}

} // namespace Scribe
