#pragma once

#include <QtCore/QReadWriteLock>
#include <QtCore/QString>
#include <QtCore/QThreadPool>
#include <functional>
#include <memory>
#include <optional>
#include "Job.hpp"
#include "../common/Expected.hpp"
#include "../common/OrchestratorError.hpp"
#include "../config/AppConfig.hpp"
#include "../transcription/TranscriptionTypes.hpp"

namespace Scribe {

/**
 * @brief Owns the single job slot and runs jobs off the caller's thread
 *
 * At most one job is pending, downloading or running. Starting a job
 * discards the previous (terminal) record. Readers get copies taken under a
 * read lock; the worker mutates the record under the write lock, one
 * pipeline event at a time.
 */
class JobManager {
public:
    // Runs the pipeline for one meeting on the worker thread; returns the transcript path.
    using PipelineRunner = std::function<Expected<QString, StageFailure>(
        const QString& meetingId, const AppConfig& config, PipelineObserver& observer)>;

    explicit JobManager(PipelineRunner runner);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    // config is copied; later configuration changes do not reach this job.
    Expected<QString, OrchestratorError> start(const QString& meetingId, const AppConfig& config);

    Expected<JobSnapshot, OrchestratorError> status(const QString& jobId) const;

    // Id of the pending/downloading/running job, if any.
    std::optional<QString> activeJobId() const;

    // Returns false if the job is still running after timeoutMs (-1 waits forever).
    bool waitForIdle(int timeoutMs = -1);

private:
    class RecordObserver;

    void execute(const QString& jobId, const QString& meetingId, const AppConfig& config);

    PipelineRunner runner_;

    mutable QReadWriteLock lock_;
    std::shared_ptr<JobRecord> current_;

    QThreadPool workerPool_;
};

} // namespace Scribe
