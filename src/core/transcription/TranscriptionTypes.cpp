#include "TranscriptionTypes.hpp"

namespace Scribe {

QString stageName(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Prepare: return QStringLiteral("Prepare");
        case PipelineStage::Fetch: return QStringLiteral("Fetch");
        case PipelineStage::Extract: return QStringLiteral("Extract");
        case PipelineStage::Recognize: return QStringLiteral("Recognize");
        case PipelineStage::Format: return QStringLiteral("Format");
    }
    return QStringLiteral("Unknown");
}

ErrorCode stageErrorCode(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Prepare: return ErrorCode::RecognitionError;
        case PipelineStage::Fetch: return ErrorCode::FetchError;
        case PipelineStage::Extract: return ErrorCode::ExtractionError;
        case PipelineStage::Recognize: return ErrorCode::RecognitionError;
        case PipelineStage::Format: return ErrorCode::FormattingError;
    }
    return ErrorCode::RecognitionError;
}

QString StageFailure::describe() const {
    return QStringLiteral("%1 failed: %2").arg(stageName(stage), message);
}

} // namespace Scribe
