#include "ConfigStore.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QMutexLocker>
#include <QtCore/QSaveFile>
#include <QtCore/QStandardPaths>

namespace Scribe {

Expected<void, QString> AtomicConfigWriter::write(const QString& filePath, const QByteArray& contents) {
    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        return makeUnexpected(QStringLiteral("Cannot create directory %1").arg(info.absolutePath()));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return makeUnexpected(file.errorString());
    }
    if (file.write(contents) != contents.size()) {
        const QString error = file.errorString();
        file.cancelWriting();
        return makeUnexpected(error);
    }
    if (!file.commit()) {
        return makeUnexpected(file.errorString());
    }
    return {};
}

ConfigStore::ConfigStore(const QString& filePath,
                         std::shared_ptr<DefaultsLocator> locator,
                         std::unique_ptr<ConfigWriter> writer)
    : filePath_(filePath)
    , locator_(locator ? std::move(locator) : std::make_shared<SystemDefaultsLocator>())
    , writer_(writer ? std::move(writer) : std::make_unique<AtomicConfigWriter>()) {
    writerPool_.setMaxThreadCount(1);
}

ConfigStore::~ConfigStore() {
    waitForIdle();
    writerPool_.waitForDone();
}

QString ConfigStore::defaultFilePath() {
    const QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(configDir).filePath("config.json");
}

AppConfig ConfigStore::load() const {
    AppConfig config;

    QFile file(filePath_);
    if (!file.exists()) {
        SCRIBE_INFO("No configuration at {}, using defaults", filePath_.toStdString());
    } else if (!file.open(QIODevice::ReadOnly)) {
        SCRIBE_WARN("Cannot read configuration {}: {}",
                    filePath_.toStdString(), file.errorString().toStdString());
    } else {
        const QByteArray contents = file.readAll().trimmed();
        if (!contents.isEmpty()) {
            QJsonParseError parseError;
            const QJsonDocument doc = QJsonDocument::fromJson(contents, &parseError);
            if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
                SCRIBE_WARN("Malformed configuration {} ({}), using defaults",
                            filePath_.toStdString(), parseError.errorString().toStdString());
            } else {
                config = AppConfig::fromJson(doc.object());
            }
        }
    }

    const QString normalized = normalizeModelPath(config.whisper.modelPath);
    if (normalized != config.whisper.modelPath) {
        SCRIBE_INFO("Model {} replaced by multilingual {}",
                    config.whisper.modelPath.toStdString(), normalized.toStdString());
        config.whisper.modelPath = normalized;
    }

    return resolveDefaults(config, *locator_);
}

Expected<void, OrchestratorError> ConfigStore::save(const AppConfig& config) {
    QMutexLocker locker(&mutex_);
    pending_ = config;
    if (writing_) {
        SCRIBE_DEBUG("Config write in flight, newest value queued");
        return {};
    }
    writing_ = true;
    return drainLocked(locker);
}

void ConfigStore::saveAsync(const AppConfig& config) {
    QMutexLocker locker(&mutex_);
    pending_ = config;
    if (writing_) {
        return;
    }
    writing_ = true;
    locker.unlock();

    writerPool_.start([this]() {
        QMutexLocker drainLocker(&mutex_);
        const auto result = drainLocked(drainLocker);
        if (result.hasError()) {
            SCRIBE_WARN("Background config save ended with {}", result.error().toString().toStdString());
        }
    });
}

void ConfigStore::waitForIdle() {
    QMutexLocker locker(&mutex_);
    while (writing_ || pending_.has_value()) {
        idle_.wait(&mutex_);
    }
}

std::optional<AppConfig> ConfigStore::lastPersisted() const {
    QMutexLocker locker(&mutex_);
    return lastPersisted_;
}

int ConfigStore::writeCount() const {
    QMutexLocker locker(&mutex_);
    return writeCount_;
}

Expected<void, OrchestratorError> ConfigStore::drainLocked(QMutexLocker<QMutex>& locker) {
    Expected<void, OrchestratorError> result;

    while (pending_.has_value()) {
        AppConfig next = std::move(*pending_);
        pending_.reset();

        locker.unlock();
        auto outcome = writeOne(next);
        locker.relock();

        if (outcome.hasValue()) {
            lastPersisted_ = std::move(next);
            ++writeCount_;
        }
        result = outcome;
    }

    writing_ = false;
    idle_.wakeAll();
    return result;
}

Expected<void, OrchestratorError> ConfigStore::writeOne(const AppConfig& config) {
    const QByteArray payload = QJsonDocument(config.toJson()).toJson(QJsonDocument::Indented);

    auto written = writer_->write(filePath_, payload);
    if (written.hasError()) {
        SCRIBE_ERROR("Failed to persist configuration to {}: {}",
                     filePath_.toStdString(), written.error().toStdString());
        return makeUnexpected(OrchestratorError(ErrorCode::ConfigPersistError, written.error()));
    }

    SCRIBE_DEBUG("Configuration written to {}", filePath_.toStdString());
    return {};
}

} // namespace Scribe
