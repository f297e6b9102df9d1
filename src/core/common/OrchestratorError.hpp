#pragma once

#include <QtCore/QString>
#include <utility>

namespace Scribe {

enum class ErrorCode {
    ConnectivityError,
    CatalogError,
    ConflictError,
    NotFound,
    InvalidArgument,
    FetchError,
    ExtractionError,
    RecognitionError,
    FormattingError,
    ConfigPersistError
};

struct OrchestratorError {
    ErrorCode code = ErrorCode::InvalidArgument;
    QString message;

    OrchestratorError() = default;
    OrchestratorError(ErrorCode c, QString msg) : code(c), message(std::move(msg)) {}

    // "<Code>: <message>", used for CLI output and log lines
    QString toString() const;
};

QString errorCodeName(ErrorCode code);

} // namespace Scribe
