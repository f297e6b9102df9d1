#pragma once

#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>
#include <optional>
#include "../core/catalog/MeetingTypes.hpp"
#include "../core/common/Expected.hpp"
#include "../core/common/OrchestratorError.hpp"
#include "../core/common/RetryManager.hpp"
#include "../core/config/AppConfig.hpp"
#include "../core/config/ConfigStore.hpp"
#include "../core/config/PlatformDefaults.hpp"
#include "../core/connectivity/ConnectivityChecker.hpp"
#include "../core/jobs/JobManager.hpp"
#include "../core/storage/ObjectStore.hpp"

namespace Scribe {

/**
 * @brief Command/query surface used by clients
 *
 * Owns the configuration store, the connectivity checker and the job
 * manager. Every method may be called from any thread; none of them waits
 * for a running transcription.
 */
class AppController : public QObject {
    Q_OBJECT

public:
    struct Options {
        QString configPath;                          // empty: ConfigStore::defaultFilePath()
        std::shared_ptr<DefaultsLocator> locator;        // null: SystemDefaultsLocator
        ObjectStoreFactory storeFactory;             // null: S3Client
        JobManager::PipelineRunner pipelineRunner;   // null: TranscriptionPipeline
        std::unique_ptr<ConfigWriter> configWriter;  // null: AtomicConfigWriter
        RetryConfig connectivityRetry = RetryConfigs::connectivity();
    };

    explicit AppController(QObject* parent = nullptr);
    explicit AppController(Options options, QObject* parent = nullptr);
    ~AppController() override;

    // list_dates
    Expected<QStringList, OrchestratorError> listDates() const;
    // list_meetings
    Expected<QList<MeetingSummary>, OrchestratorError> listMeetings(const QString& date) const;

    // start_transcribe
    Expected<QString, OrchestratorError> startTranscribe(const QString& meetingId);
    // get_transcribe_status
    Expected<JobSnapshot, OrchestratorError> transcribeStatus(const QString& jobId) const;
    std::optional<QString> activeJobId() const;

    // get_config / set_config
    AppConfig config() const;
    void setConfig(const AppConfig& config);
    // Waits for queued configuration writes; fails if the current
    // configuration did not reach the disk.
    Expected<void, OrchestratorError> flushConfig();
    QString configPath() const;

    // check_minio
    Health checkMinio() const;

    std::optional<QString> defaultWhisperBinary() const;
    std::optional<QString> defaultFfmpegBinary() const;
    std::optional<QString> defaultOutputDir() const;
    std::optional<QString> defaultWhisperModelRoot() const;

    // Blocks until the running job, if any, finishes. For shutdown and tests.
    bool waitForJobs(int timeoutMs = -1);

    static JobManager::PipelineRunner defaultPipelineRunner(ObjectStoreFactory storeFactory,
                                                            std::shared_ptr<DefaultsLocator> locator);

signals:
    void configChanged();
    void jobStarted(const QString& jobId, const QString& meetingId);

private:
    std::unique_ptr<ObjectStore> openStore() const;

    std::shared_ptr<DefaultsLocator> locator_;
    ObjectStoreFactory storeFactory_;
    std::unique_ptr<ConfigStore> configStore_;
    std::unique_ptr<ConnectivityChecker> connectivity_;
    std::unique_ptr<JobManager> jobManager_;

    mutable QMutex configMutex_;
    AppConfig config_;
};

} // namespace Scribe
