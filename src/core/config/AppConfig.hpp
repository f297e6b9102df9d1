#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Scribe {

struct MinioSettings {
    QString url;
    QString region;
    QString accessKey;
    QString secretKey;
    QString bucket;

    // url, accessKey, secretKey and bucket are all non-blank
    bool isComplete() const;
    // Blank region falls back to us-east-1
    QString effectiveRegion() const;

    bool operator==(const MinioSettings& other) const;
    bool operator!=(const MinioSettings& other) const { return !(*this == other); }
};

struct WhisperSettings {
    QString binaryPath;
    QString ffmpegPath;
    QString modelPath;
    QString outputDir;
    bool includeTimestamps = false;
    bool includeSpeaker = true;
    QString language = QStringLiteral("ja");

    bool operator==(const WhisperSettings& other) const;
    bool operator!=(const WhisperSettings& other) const { return !(*this == other); }
};

struct AppConfig {
    MinioSettings minio;
    WhisperSettings whisper;

    QJsonObject toJson() const;
    // Missing keys keep their defaults; snake_case aliases are accepted.
    static AppConfig fromJson(const QJsonObject& json);

    bool operator==(const AppConfig& other) const;
    bool operator!=(const AppConfig& other) const { return !(*this == other); }
};

/**
 * @brief One-time model migration applied on load
 *
 * A model file named ggml-<name>.en.bin is replaced by its multilingual
 * equivalent ggml-<name>.bin in the same directory. Any other value is
 * returned unchanged.
 */
QString normalizeModelPath(const QString& modelPath);

// Applies setting "<section>.<key>" from its string form (CLI "config set").
bool applyConfigValue(AppConfig& config, const QString& dottedKey, const QString& value);

} // namespace Scribe
