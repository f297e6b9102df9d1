#include "AppConfig.hpp"
#include <QtCore/QRegularExpression>
#include <algorithm>

namespace Scribe {

namespace {

QString readString(const QJsonObject& object, const QString& key, const QString& alias,
                   const QString& fallback) {
    if (object.contains(key) && object.value(key).isString()) {
        return object.value(key).toString();
    }
    if (!alias.isEmpty() && object.contains(alias) && object.value(alias).isString()) {
        return object.value(alias).toString();
    }
    return fallback;
}

bool readBool(const QJsonObject& object, const QString& key, const QString& alias, bool fallback) {
    if (object.value(key).isBool()) {
        return object.value(key).toBool();
    }
    if (object.value(alias).isBool()) {
        return object.value(alias).toBool();
    }
    return fallback;
}

bool parseBool(const QString& value, bool& out) {
    const QString lowered = value.trimmed().toLower();
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        out = true;
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

bool MinioSettings::isComplete() const {
    return !url.trimmed().isEmpty() &&
           !accessKey.trimmed().isEmpty() &&
           !secretKey.trimmed().isEmpty() &&
           !bucket.trimmed().isEmpty();
}

QString MinioSettings::effectiveRegion() const {
    const QString trimmed = region.trimmed();
    return trimmed.isEmpty() ? QStringLiteral("us-east-1") : trimmed;
}

bool MinioSettings::operator==(const MinioSettings& other) const {
    return url == other.url && region == other.region &&
           accessKey == other.accessKey && secretKey == other.secretKey &&
           bucket == other.bucket;
}

bool WhisperSettings::operator==(const WhisperSettings& other) const {
    return binaryPath == other.binaryPath && ffmpegPath == other.ffmpegPath &&
           modelPath == other.modelPath && outputDir == other.outputDir &&
           includeTimestamps == other.includeTimestamps &&
           includeSpeaker == other.includeSpeaker &&
           language == other.language;
}

bool AppConfig::operator==(const AppConfig& other) const {
    return minio == other.minio && whisper == other.whisper;
}

QJsonObject AppConfig::toJson() const {
    QJsonObject minioJson;
    minioJson["url"] = minio.url;
    minioJson["region"] = minio.region;
    minioJson["accessKey"] = minio.accessKey;
    minioJson["secretKey"] = minio.secretKey;
    minioJson["bucket"] = minio.bucket;

    QJsonObject whisperJson;
    whisperJson["binaryPath"] = whisper.binaryPath;
    whisperJson["ffmpegPath"] = whisper.ffmpegPath;
    whisperJson["modelPath"] = whisper.modelPath;
    whisperJson["outputDir"] = whisper.outputDir;
    whisperJson["includeTimestamps"] = whisper.includeTimestamps;
    whisperJson["includeSpeaker"] = whisper.includeSpeaker;
    whisperJson["language"] = whisper.language;

    QJsonObject root;
    root["minio"] = minioJson;
    root["whisper"] = whisperJson;
    return root;
}

AppConfig AppConfig::fromJson(const QJsonObject& json) {
    AppConfig config;

    const QJsonObject minioJson = json.value("minio").toObject();
    config.minio.url = readString(minioJson, "url", QString(), config.minio.url);
    config.minio.region = readString(minioJson, "region", QString(), config.minio.region);
    config.minio.accessKey = readString(minioJson, "accessKey", "access_key", config.minio.accessKey);
    config.minio.secretKey = readString(minioJson, "secretKey", "secret_key", config.minio.secretKey);
    config.minio.bucket = readString(minioJson, "bucket", QString(), config.minio.bucket);

    const QJsonObject whisperJson = json.value("whisper").toObject();
    WhisperSettings& w = config.whisper;
    w.binaryPath = readString(whisperJson, "binaryPath", "binary_path", w.binaryPath);
    w.ffmpegPath = readString(whisperJson, "ffmpegPath", "ffmpeg_path", w.ffmpegPath);
    w.modelPath = readString(whisperJson, "modelPath", "model_path", w.modelPath);
    w.outputDir = readString(whisperJson, "outputDir", "output_dir", w.outputDir);
    w.includeTimestamps = readBool(whisperJson, "includeTimestamps", "include_timestamps", w.includeTimestamps);
    w.includeSpeaker = readBool(whisperJson, "includeSpeaker", "include_speaker", w.includeSpeaker);
    w.language = readString(whisperJson, "language", QString(), w.language);
    if (w.language.trimmed().isEmpty()) {
        w.language = QStringLiteral("ja");
    }

    return config;
}

QString normalizeModelPath(const QString& modelPath) {
    static const QRegularExpression englishOnly(QStringLiteral(R"(^ggml-(.+)\.en\.bin$)"));

    const auto separator = std::max(modelPath.lastIndexOf('/'), modelPath.lastIndexOf('\\'));
    const QString directory = modelPath.left(separator + 1);
    const QString fileName = modelPath.mid(separator + 1);

    const QRegularExpressionMatch match = englishOnly.match(fileName);
    if (!match.hasMatch()) {
        return modelPath;
    }
    return directory + QStringLiteral("ggml-%1.bin").arg(match.captured(1));
}

bool applyConfigValue(AppConfig& config, const QString& dottedKey, const QString& value) {
    const QString key = dottedKey.trimmed();

    if (key == "minio.url") { config.minio.url = value; return true; }
    if (key == "minio.region") { config.minio.region = value; return true; }
    if (key == "minio.accessKey") { config.minio.accessKey = value; return true; }
    if (key == "minio.secretKey") { config.minio.secretKey = value; return true; }
    if (key == "minio.bucket") { config.minio.bucket = value; return true; }

    if (key == "whisper.binaryPath") { config.whisper.binaryPath = value; return true; }
    if (key == "whisper.ffmpegPath") { config.whisper.ffmpegPath = value; return true; }
    if (key == "whisper.modelPath") { config.whisper.modelPath = value; return true; }
    if (key == "whisper.outputDir") { config.whisper.outputDir = value; return true; }
    if (key == "whisper.language") {
        if (value.trimmed().isEmpty()) {
            return false;
        }
        config.whisper.language = value.trimmed();
        return true;
    }
    if (key == "whisper.includeTimestamps") {
        return parseBool(value, config.whisper.includeTimestamps);
    }
    if (key == "whisper.includeSpeaker") {
        return parseBool(value, config.whisper.includeSpeaker);
    }

    return false;
}

} // namespace Scribe
