#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>
#include "AppConfig.hpp"

namespace Scribe {

/**
 * @brief Source of default locations for tools, models and transcripts
 *
 * resolveDefaults() and the pipeline's tool resolution only talk to this
 * interface, so tests can substitute fixed answers.
 */
class DefaultsLocator {
public:
    virtual ~DefaultsLocator() = default;

    virtual std::optional<QString> whisperBinary() const = 0;
    virtual std::optional<QString> ffmpegBinary() const = 0;
    virtual std::optional<QString> modelRoot() const = 0;
    virtual std::optional<QString> outputDir() const = 0;
};

/**
 * @brief Locates tools on the running system
 *
 * Binaries: environment override (WHISPER_BINARY / FFMPEG_BINARY), then the
 * PATH, then the usual install prefixes. Model root and output directory come
 * from QStandardPaths.
 */
class SystemDefaultsLocator : public DefaultsLocator {
public:
    std::optional<QString> whisperBinary() const override;
    std::optional<QString> ffmpegBinary() const override;
    std::optional<QString> modelRoot() const override;
    std::optional<QString> outputDir() const override;

    static QStringList whisperCandidates();
    static QStringList installPrefixes();
};

// Existing file path, or the result of a PATH lookup, or empty.
QString locateExecutable(const QString& nameOrPath);

// Fills blank binaryPath, ffmpegPath, modelPath and outputDir from the locator.
// Fields the locator cannot answer stay blank. Pure apart from the locator calls.
AppConfig resolveDefaults(const AppConfig& config, const DefaultsLocator& locator);

// Resolution used when a job starts. Empty result means nothing usable was found.
QString resolveWhisperBinary(const WhisperSettings& settings, const DefaultsLocator& locator);
QString resolveFfmpegBinary(const WhisperSettings& settings, const DefaultsLocator& locator);
// Relative names resolve under the model root with a leading "models/" dropped;
// blank resolves to <modelRoot>/ggml-large-v3.bin.
QString resolveModelPath(const WhisperSettings& settings, const DefaultsLocator& locator);

} // namespace Scribe
