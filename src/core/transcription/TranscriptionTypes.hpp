#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QtGlobal>
#include "../common/OrchestratorError.hpp"

namespace Scribe {

enum class PipelineStage {
    Prepare,
    Fetch,
    Extract,
    Recognize,
    Format
};

QString stageName(PipelineStage stage);

// Error code a failure in the given stage is reported with.
ErrorCode stageErrorCode(PipelineStage stage);

struct TranscriptSegment {
    qint64 startTime = 0;  // milliseconds
    qint64 endTime = 0;    // milliseconds, equal to startTime when the engine gave no end
    QString speaker;
    QString text;

    qint64 duration() const {
        return endTime - startTime;
    }
};

// Missing tools are reported against the stage that needs them.
struct StageFailure {
    PipelineStage stage = PipelineStage::Prepare;
    QString message;

    // "<Stage> failed: <message>"
    QString describe() const;
};

/**
 * @brief Receives pipeline events on the pipeline thread
 *
 * Calls arrive in the order the pipeline produces them.
 */
class PipelineObserver {
public:
    virtual ~PipelineObserver() = default;

    virtual void onStageStarted(PipelineStage stage) = 0;
    // Total progress units, known once the tracks are resolved
    virtual void onTotalKnown(int total) = 0;
    // Absolute progress units completed so far
    virtual void onProgress(int completed) = 0;
    virtual void onLogLine(const QString& line) = 0;
};

// Progress units contributed by each audio track
constexpr int PROGRESS_UNITS_PER_TRACK = 100;

} // namespace Scribe
