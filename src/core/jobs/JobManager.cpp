#include "JobManager.hpp"
#include "../catalog/MeetingCatalog.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QReadLocker>
#include <QtCore/QUuid>
#include <QtCore/QWriteLocker>
#include <exception>

namespace Scribe {

// Applies pipeline events to one job record under the manager's write lock.
class JobManager::RecordObserver : public PipelineObserver {
public:
    RecordObserver(QReadWriteLock& lock, std::shared_ptr<JobRecord> record)
        : lock_(lock), record_(std::move(record)) {}

    void onStageStarted(PipelineStage stage) override {
        SCRIBE_INFO("Job {}: {} stage started", jobId().toStdString(), stageName(stage).toStdString());
        QWriteLocker locker(&lock_);
        currentStage_ = stage;
        switch (stage) {
            case PipelineStage::Prepare:
                break;
            case PipelineStage::Fetch:
                record_->advanceTo(JobState::Downloading);
                break;
            case PipelineStage::Extract:
            case PipelineStage::Recognize:
            case PipelineStage::Format:
                record_->advanceTo(JobState::Running);
                break;
        }
        record_->appendLog(QStringLiteral("%1 stage started").arg(stageName(stage)));
    }

    void onTotalKnown(int total) override {
        QWriteLocker locker(&lock_);
        record_->setTotal(total);
    }

    void onProgress(int completed) override {
        QWriteLocker locker(&lock_);
        record_->setCompleted(completed);
    }

    void onLogLine(const QString& line) override {
        QWriteLocker locker(&lock_);
        record_->appendLog(line);
    }

    // Stage most recently started; failures outside a stage result are charged to it.
    PipelineStage currentStage() const {
        QReadLocker locker(&lock_);
        return currentStage_;
    }

private:
    QString jobId() const {
        QReadLocker locker(&lock_);
        return record_->snapshot().jobId;
    }

    QReadWriteLock& lock_;
    std::shared_ptr<JobRecord> record_;
    PipelineStage currentStage_ = PipelineStage::Prepare;
};

JobManager::JobManager(PipelineRunner runner)
    : runner_(std::move(runner)) {
    // The recognition engine and ffmpeg saturate the machine on their own
    workerPool_.setMaxThreadCount(1);
}

JobManager::~JobManager() {
    workerPool_.waitForDone();
}

Expected<QString, OrchestratorError> JobManager::start(const QString& meetingId, const AppConfig& config) {
    if (!MeetingCatalog::parseMeetingId(meetingId)) {
        return makeUnexpected(OrchestratorError(ErrorCode::InvalidArgument,
                                                QStringLiteral("Invalid meeting id: '%1'").arg(meetingId)));
    }

    QString jobId;
    {
        QWriteLocker locker(&lock_);
        if (current_ && !current_->snapshot().isTerminal()) {
            const JobSnapshot& active = current_->snapshot();
            SCRIBE_WARN("Rejected job for {}: job {} is {}", meetingId.toStdString(),
                        active.jobId.toStdString(), jobStateName(active.state).toStdString());
            return makeUnexpected(OrchestratorError(
                ErrorCode::ConflictError,
                QStringLiteral("Job %1 is already %2").arg(active.jobId, jobStateName(active.state))));
        }

        jobId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        current_ = std::make_shared<JobRecord>(jobId, meetingId);
    }

    SCRIBE_INFO("Job {} created for meeting {}", jobId.toStdString(), meetingId.toStdString());
    workerPool_.start([this, jobId, meetingId, config]() {
        execute(jobId, meetingId, config);
    });
    return jobId;
}

Expected<JobSnapshot, OrchestratorError> JobManager::status(const QString& jobId) const {
    QReadLocker locker(&lock_);
    if (!current_ || current_->snapshot().jobId != jobId) {
        return makeUnexpected(OrchestratorError(ErrorCode::NotFound,
                                                QStringLiteral("Unknown job id: '%1'").arg(jobId)));
    }
    return current_->snapshot();
}

std::optional<QString> JobManager::activeJobId() const {
    QReadLocker locker(&lock_);
    if (current_ && !current_->snapshot().isTerminal()) {
        return current_->snapshot().jobId;
    }
    return std::nullopt;
}

bool JobManager::waitForIdle(int timeoutMs) {
    return workerPool_.waitForDone(timeoutMs);
}

void JobManager::execute(const QString& jobId, const QString& meetingId, const AppConfig& config) {
    std::shared_ptr<JobRecord> record;
    {
        QReadLocker locker(&lock_);
        record = current_;
    }
    if (!record || record->snapshot().jobId != jobId) {
        SCRIBE_ERROR("Job {} vanished before it started", jobId.toStdString());
        return;
    }

    RecordObserver observer(lock_, record);
    std::optional<Expected<QString, StageFailure>> outcome;
    QString internalError;

    try {
        if (runner_) {
            outcome.emplace(runner_(meetingId, config, observer));
        } else {
            internalError = QStringLiteral("no pipeline configured");
        }
    } catch (const std::exception& e) {
        internalError = QString::fromUtf8(e.what());
    } catch (...) {
        internalError = QStringLiteral("unknown exception");
    }

    const PipelineStage lastStage = observer.currentStage();
    QWriteLocker locker(&lock_);
    if (!internalError.isEmpty()) {
        const StageFailure failure{lastStage, QStringLiteral("internal error: %1").arg(internalError)};
        SCRIBE_CRITICAL("Job {} aborted: {}", jobId.toStdString(), failure.describe().toStdString());
        record->fail(stageErrorCode(failure.stage), failure.describe());
        return;
    }

    if (outcome->hasValue() && outcome->value().isEmpty()) {
        const StageFailure failure{PipelineStage::Format, QStringLiteral("no transcript was written")};
        record->fail(stageErrorCode(failure.stage), failure.describe());
        SCRIBE_ERROR("Job {} failed: {}", jobId.toStdString(), failure.describe().toStdString());
    } else if (outcome->hasValue()) {
        record->complete(outcome->value());
        SCRIBE_INFO("Job {} completed: {}", jobId.toStdString(), outcome->value().toStdString());
    } else {
        const StageFailure& failure = outcome->error();
        record->fail(stageErrorCode(failure.stage), failure.describe());
        SCRIBE_ERROR("Job {} failed: {}", jobId.toStdString(), failure.describe().toStdString());
    }
}

} // namespace Scribe
