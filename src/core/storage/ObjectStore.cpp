#include "ObjectStore.hpp"

namespace Scribe {

QString storeErrorName(StoreError error) {
    switch (error) {
        case StoreError::IncompleteConfig: return QStringLiteral("IncompleteConfig");
        case StoreError::NetworkError: return QStringLiteral("NetworkError");
        case StoreError::Timeout: return QStringLiteral("Timeout");
        case StoreError::AuthFailed: return QStringLiteral("AuthFailed");
        case StoreError::BucketMissing: return QStringLiteral("BucketMissing");
        case StoreError::NotFound: return QStringLiteral("NotFound");
        case StoreError::ServerError: return QStringLiteral("ServerError");
        case StoreError::InvalidResponse: return QStringLiteral("InvalidResponse");
        case StoreError::FileSystemError: return QStringLiteral("FileSystemError");
    }
    return QStringLiteral("Unknown");
}

bool isTransientStoreError(StoreError error) {
    return error == StoreError::NetworkError ||
           error == StoreError::Timeout ||
           error == StoreError::ServerError;
}

} // namespace Scribe
