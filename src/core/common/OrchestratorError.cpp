#include "OrchestratorError.hpp"

namespace Scribe {

QString errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectivityError: return QStringLiteral("ConnectivityError");
        case ErrorCode::CatalogError: return QStringLiteral("CatalogError");
        case ErrorCode::ConflictError: return QStringLiteral("ConflictError");
        case ErrorCode::NotFound: return QStringLiteral("NotFound");
        case ErrorCode::InvalidArgument: return QStringLiteral("InvalidArgument");
        case ErrorCode::FetchError: return QStringLiteral("FetchError");
        case ErrorCode::ExtractionError: return QStringLiteral("ExtractionError");
        case ErrorCode::RecognitionError: return QStringLiteral("RecognitionError");
        case ErrorCode::FormattingError: return QStringLiteral("FormattingError");
        case ErrorCode::ConfigPersistError: return QStringLiteral("ConfigPersistError");
    }
    return QStringLiteral("UnknownError");
}

QString OrchestratorError::toString() const {
    return QStringLiteral("%1: %2").arg(errorCodeName(code), message);
}

} // namespace Scribe
