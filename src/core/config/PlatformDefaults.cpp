#include "PlatformDefaults.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>
#include <QtCore/QtGlobal>

namespace Scribe {

namespace {

constexpr const char* DEFAULT_MODEL_FILE = "ggml-large-v3.bin";

bool isFile(const QString& path) {
    return !path.isEmpty() && QFileInfo(path).isFile();
}

#if defined(Q_OS_WIN)
QString documentsAppDir() {
    const QString documents = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
    if (documents.isEmpty()) {
        return QString();
    }
    return QDir(documents).filePath("ScribeDesktop");
}
#endif

std::optional<QString> fromEnvironment(const char* variable) {
    const QString value = qEnvironmentVariable(variable).trimmed();
    if (value.isEmpty()) {
        return std::nullopt;
    }
    const QString located = locateExecutable(value);
    if (located.isEmpty()) {
        SCRIBE_WARN("{} is set to '{}' but no such executable exists", variable, value.toStdString());
        return std::nullopt;
    }
    return located;
}

} // namespace

QString locateExecutable(const QString& nameOrPath) {
    const QString trimmed = nameOrPath.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }
    if (isFile(trimmed)) {
        return QFileInfo(trimmed).absoluteFilePath();
    }
    return QStandardPaths::findExecutable(trimmed);
}

QStringList SystemDefaultsLocator::whisperCandidates() {
    return {"whisper-cli", "whisper", "whisper-cpp", "main"};
}

QStringList SystemDefaultsLocator::installPrefixes() {
#if defined(Q_OS_MACOS)
    return {"/opt/homebrew/bin", "/usr/local/bin"};
#elif defined(Q_OS_WIN)
    return {};
#else
    return {"/usr/local/bin", "/usr/bin"};
#endif
}

std::optional<QString> SystemDefaultsLocator::whisperBinary() const {
    if (auto fromEnv = fromEnvironment("WHISPER_BINARY")) {
        return fromEnv;
    }

    for (const QString& candidate : whisperCandidates()) {
        const QString found = QStandardPaths::findExecutable(candidate);
        if (!found.isEmpty()) {
            return found;
        }
    }

    QStringList locations;
    for (const QString& prefix : installPrefixes()) {
        locations << QDir(prefix).filePath("whisper-cli");
    }
#if defined(Q_OS_WIN)
    const QString appDir = documentsAppDir();
    if (!appDir.isEmpty()) {
        locations << QDir(appDir).filePath("whisper-bin-x64/Release/whisper-cli.exe");
    }
#endif
    for (const QString& location : locations) {
        if (isFile(location)) {
            return location;
        }
    }

    return std::nullopt;
}

std::optional<QString> SystemDefaultsLocator::ffmpegBinary() const {
    if (auto fromEnv = fromEnvironment("FFMPEG_BINARY")) {
        return fromEnv;
    }

    const QString found = QStandardPaths::findExecutable("ffmpeg");
    if (!found.isEmpty()) {
        return found;
    }

    for (const QString& prefix : installPrefixes()) {
        const QString location = QDir(prefix).filePath("ffmpeg");
        if (isFile(location)) {
            return location;
        }
    }

    return std::nullopt;
}

std::optional<QString> SystemDefaultsLocator::modelRoot() const {
#if defined(Q_OS_WIN)
    const QString appDir = documentsAppDir();
    if (!appDir.isEmpty()) {
        return appDir;
    }
#endif
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (dataDir.isEmpty()) {
        return std::nullopt;
    }
    return QDir(dataDir).filePath("whisper/models");
}

std::optional<QString> SystemDefaultsLocator::outputDir() const {
    const QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (!downloads.isEmpty()) {
        return downloads;
    }
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (dataDir.isEmpty()) {
        return std::nullopt;
    }
    return QDir(dataDir).filePath("transcripts");
}

AppConfig resolveDefaults(const AppConfig& config, const DefaultsLocator& locator) {
    AppConfig resolved = config;
    WhisperSettings& w = resolved.whisper;

    if (w.binaryPath.trimmed().isEmpty()) {
        w.binaryPath = locator.whisperBinary().value_or(QString());
    }
    if (w.ffmpegPath.trimmed().isEmpty()) {
        w.ffmpegPath = locator.ffmpegBinary().value_or(QString());
    }
    if (w.modelPath.trimmed().isEmpty()) {
        if (auto root = locator.modelRoot()) {
            w.modelPath = QDir(*root).filePath(DEFAULT_MODEL_FILE);
        }
    }
    if (w.outputDir.trimmed().isEmpty()) {
        w.outputDir = locator.outputDir().value_or(QString());
    }

    return resolved;
}

QString resolveWhisperBinary(const WhisperSettings& settings, const DefaultsLocator& locator) {
    const QString requested = settings.binaryPath.trimmed();
    if (!requested.isEmpty()) {
        const QString located = locateExecutable(requested);
        // Keep an explicit but missing path so the error names it
        return located.isEmpty() ? requested : located;
    }
    return locator.whisperBinary().value_or(QString());
}

QString resolveFfmpegBinary(const WhisperSettings& settings, const DefaultsLocator& locator) {
    const QString requested = settings.ffmpegPath.trimmed();
    if (!requested.isEmpty()) {
        const QString located = locateExecutable(requested);
        if (!located.isEmpty()) {
            return located;
        }
        SCRIBE_WARN("Configured ffmpeg '{}' not found, falling back to defaults", requested.toStdString());
    }
    return locator.ffmpegBinary().value_or(QString());
}

QString resolveModelPath(const WhisperSettings& settings, const DefaultsLocator& locator) {
    const QString requested = settings.modelPath.trimmed();
    const QString root = locator.modelRoot().value_or(QString());

    if (requested.isEmpty()) {
        return root.isEmpty() ? QString() : QDir(root).filePath(DEFAULT_MODEL_FILE);
    }
    if (QDir::isAbsolutePath(requested) || root.isEmpty()) {
        return requested;
    }

    QString relative = requested;
    if (relative.startsWith("models/") || relative.startsWith("models\\")) {
        relative = relative.mid(7);
    }
    return QDir(root).filePath(relative);
}

} // namespace Scribe
