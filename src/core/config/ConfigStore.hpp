#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QString>
#include <QtCore/QThreadPool>
#include <QtCore/QWaitCondition>
#include <memory>
#include <optional>
#include "AppConfig.hpp"
#include "PlatformDefaults.hpp"
#include "../common/Expected.hpp"
#include "../common/OrchestratorError.hpp"

namespace Scribe {

// Writes the serialized configuration to disk.
class ConfigWriter {
public:
    virtual ~ConfigWriter() = default;
    virtual Expected<void, QString> write(const QString& filePath, const QByteArray& contents) = 0;
};

// QSaveFile based writer: parent directory created, temp file committed by rename.
class AtomicConfigWriter : public ConfigWriter {
public:
    Expected<void, QString> write(const QString& filePath, const QByteArray& contents) override;
};

/**
 * @brief Loads and persists AppConfig as JSON
 *
 * Writes are serialized and coalesced: while one write is in flight, newer
 * values replace a single pending slot and exactly one follow-up write is
 * issued with the newest value once the in-flight write completes.
 */
class ConfigStore {
public:
    explicit ConfigStore(const QString& filePath = defaultFilePath(),
                         std::shared_ptr<DefaultsLocator> locator = nullptr,
                         std::unique_ptr<ConfigWriter> writer = nullptr);
    ~ConfigStore();

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    static QString defaultFilePath();

    const QString& filePath() const { return filePath_; }
    const DefaultsLocator& locator() const { return *locator_; }

    // Missing, empty or malformed file yields defaults. Applies model
    // normalization and resolveDefaults().
    AppConfig load() const;

    // Blocking write. If another write is in flight the value is queued
    // behind it and the call returns once it is accepted.
    Expected<void, OrchestratorError> save(const AppConfig& config);

    // Queues the value in call order and drains on a background thread.
    void saveAsync(const AppConfig& config);

    // Blocks until no write is in flight or pending.
    void waitForIdle();

    std::optional<AppConfig> lastPersisted() const;
    int writeCount() const;

private:
    // Caller holds mutex_ through locker and has set writing_.
    Expected<void, OrchestratorError> drainLocked(QMutexLocker<QMutex>& locker);
    Expected<void, OrchestratorError> writeOne(const AppConfig& config);

    QString filePath_;
    std::shared_ptr<DefaultsLocator> locator_;
    std::unique_ptr<ConfigWriter> writer_;

    mutable QMutex mutex_;
    QWaitCondition idle_;
    bool writing_ = false;
    std::optional<AppConfig> pending_;
    std::optional<AppConfig> lastPersisted_;
    int writeCount_ = 0;

    QThreadPool writerPool_;
};

} // namespace Scribe
