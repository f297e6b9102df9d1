#include "AppController.hpp"
#include "../core/catalog/MeetingCatalog.hpp"
#include "../core/common/Logger.hpp"
#include "../core/storage/S3Client.hpp"
#include "../core/transcription/TranscriptionPipeline.hpp"
#include <QtCore/QMutexLocker>

namespace Scribe {

AppController::AppController(QObject* parent)
    : AppController(Options{}, parent) {
}

AppController::AppController(Options options, QObject* parent)
    : QObject(parent)
    , locator_(options.locator ? std::move(options.locator) : std::make_shared<SystemDefaultsLocator>())
    , storeFactory_(options.storeFactory ? std::move(options.storeFactory) : S3Client::factory()) {

    const QString configPath = options.configPath.isEmpty() ? ConfigStore::defaultFilePath()
                                                            : options.configPath;
    SCRIBE_INFO("Creating ConfigStore at {}", configPath.toStdString());
    configStore_ = std::make_unique<ConfigStore>(configPath, locator_, std::move(options.configWriter));
    config_ = configStore_->load();

    connectivity_ = std::make_unique<ConnectivityChecker>(storeFactory_, options.connectivityRetry);

    JobManager::PipelineRunner runner = options.pipelineRunner
        ? std::move(options.pipelineRunner)
        : defaultPipelineRunner(storeFactory_, locator_);
    jobManager_ = std::make_unique<JobManager>(std::move(runner));

    SCRIBE_INFO("AppController created");
}

AppController::~AppController() {
    // The job may still use the store factory and the locator
    jobManager_->waitForIdle();
    configStore_->waitForIdle();
    SCRIBE_INFO("AppController destroyed");
}

JobManager::PipelineRunner AppController::defaultPipelineRunner(ObjectStoreFactory storeFactory,
                                                                std::shared_ptr<DefaultsLocator> locator) {
    return [storeFactory, locator](const QString& meetingId,
                                 const AppConfig& config,
                                 PipelineObserver& observer) -> Expected<QString, StageFailure> {
        std::unique_ptr<ObjectStore> store = storeFactory(config.minio);
        if (!store) {
            return makeUnexpected(StageFailure{PipelineStage::Fetch, QStringLiteral("no object store available")});
        }
        TranscriptionPipeline pipeline(*store, config, locator);
        return pipeline.run(meetingId, observer);
    };
}

std::unique_ptr<ObjectStore> AppController::openStore() const {
    return storeFactory_(config().minio);
}

Expected<QStringList, OrchestratorError> AppController::listDates() const {
    auto store = openStore();
    if (!store) {
        return makeUnexpected(OrchestratorError(ErrorCode::CatalogError, QStringLiteral("no object store available")));
    }
    MeetingCatalog catalog(*store);
    return catalog.listDates();
}

Expected<QList<MeetingSummary>, OrchestratorError> AppController::listMeetings(const QString& date) const {
    auto store = openStore();
    if (!store) {
        return makeUnexpected(OrchestratorError(ErrorCode::CatalogError, QStringLiteral("no object store available")));
    }
    MeetingCatalog catalog(*store);
    return catalog.listMeetings(date);
}

Expected<QString, OrchestratorError> AppController::startTranscribe(const QString& meetingId) {
    auto jobId = jobManager_->start(meetingId, config());
    if (jobId.hasValue()) {
        emit jobStarted(jobId.value(), meetingId);
    }
    return jobId;
}

Expected<JobSnapshot, OrchestratorError> AppController::transcribeStatus(const QString& jobId) const {
    return jobManager_->status(jobId);
}

std::optional<QString> AppController::activeJobId() const {
    return jobManager_->activeJobId();
}

AppConfig AppController::config() const {
    QMutexLocker locker(&configMutex_);
    return config_;
}

void AppController::setConfig(const AppConfig& config) {
    {
        QMutexLocker locker(&configMutex_);
        config_ = config;
        // Queued under the same lock so writes follow the order of the updates
        configStore_->saveAsync(config);
    }
    SCRIBE_DEBUG("Configuration updated");
    emit configChanged();
}

Expected<void, OrchestratorError> AppController::flushConfig() {
    configStore_->waitForIdle();

    const AppConfig current = config();
    const auto persisted = configStore_->lastPersisted();
    if (!persisted || *persisted != current) {
        return makeUnexpected(OrchestratorError(
            ErrorCode::ConfigPersistError,
            QStringLiteral("Configuration could not be written to %1").arg(configStore_->filePath())));
    }
    return {};
}

QString AppController::configPath() const {
    return configStore_->filePath();
}

Health AppController::checkMinio() const {
    return connectivity_->check(config());
}

std::optional<QString> AppController::defaultWhisperBinary() const {
    return locator_->whisperBinary();
}

std::optional<QString> AppController::defaultFfmpegBinary() const {
    return locator_->ffmpegBinary();
}

std::optional<QString> AppController::defaultOutputDir() const {
    return locator_->outputDir();
}

std::optional<QString> AppController::defaultWhisperModelRoot() const {
    return locator_->modelRoot();
}

bool AppController::waitForJobs(int timeoutMs) {
    return jobManager_->waitForIdle(timeoutMs);
}

} // namespace Scribe
