#include "WhisperOutputReader.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QRegularExpression>
#include <QtCore/QStringList>
#include <algorithm>
#include <cmath>

namespace Scribe {

namespace {

qint64 secondsToMs(double seconds) {
    return static_cast<qint64>(std::llround(seconds * 1000.0));
}

} // namespace

std::optional<qint64> WhisperOutputReader::parseTimestampMs(const QString& value) {
    const QStringList parts = value.trimmed().split(':');
    if (parts.size() != 3) {
        return std::nullopt;
    }

    bool hoursOk = false;
    bool minutesOk = false;
    const qint64 hours = parts.at(0).toLongLong(&hoursOk);
    const qint64 minutes = parts.at(1).toLongLong(&minutesOk);
    if (!hoursOk || !minutesOk) {
        return std::nullopt;
    }

    const QStringList secondParts = parts.at(2).split(QRegularExpression("[,.]"));
    bool secondsOk = false;
    const qint64 seconds = secondParts.at(0).toLongLong(&secondsOk);
    if (!secondsOk) {
        return std::nullopt;
    }
    qint64 millis = 0;
    if (secondParts.size() > 1) {
        bool millisOk = false;
        millis = secondParts.at(1).toLongLong(&millisOk);
        if (!millisOk) {
            millis = 0;
        }
    }

    return ((hours * 60 + minutes) * 60 + seconds) * 1000 + millis;
}

std::optional<TranscriptSegment> WhisperOutputReader::segmentFromValue(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject object = value.toObject();
    const QString text = object.value("text").toString().trimmed();
    if (text.isEmpty()) {
        return std::nullopt;
    }

    TranscriptSegment segment;
    segment.text = text;
    segment.speaker = object.value("speaker").toString();

    std::optional<qint64> end;
    if (object.value("start").isDouble()) {
        segment.startTime = secondsToMs(object.value("start").toDouble());
        if (object.value("end").isDouble()) {
            end = secondsToMs(object.value("end").toDouble());
        }
    } else if (object.value("offsets").isObject()) {
        const QJsonObject offsets = object.value("offsets").toObject();
        segment.startTime = static_cast<qint64>(offsets.value("from").toDouble(0.0));
        if (offsets.value("to").isDouble()) {
            end = static_cast<qint64>(offsets.value("to").toDouble());
        }
    } else if (object.value("timestamps").isObject()) {
        const QJsonObject timestamps = object.value("timestamps").toObject();
        segment.startTime = parseTimestampMs(timestamps.value("from").toString()).value_or(0);
        end = parseTimestampMs(timestamps.value("to").toString());
    } else if (object.value("t0").isDouble()) {
        segment.startTime = static_cast<qint64>(object.value("t0").toDouble() * 10.0);
        if (object.value("t1").isDouble()) {
            end = static_cast<qint64>(object.value("t1").toDouble() * 10.0);
        }
    }

    segment.endTime = (end && *end >= segment.startTime) ? *end : segment.startTime;
    return segment;
}

std::optional<QList<TranscriptSegment>> WhisperOutputReader::segmentsFromArray(const QJsonArray& items) {
    QList<TranscriptSegment> segments;
    for (const QJsonValue& item : items) {
        if (auto segment = segmentFromValue(item)) {
            segments.append(*segment);
        }
    }
    if (segments.isEmpty()) {
        return std::nullopt;
    }
    return segments;
}

std::optional<QList<TranscriptSegment>> WhisperOutputReader::segmentsFromValue(const QJsonValue& value) {
    if (value.isArray()) {
        return segmentsFromArray(value.toArray());
    }
    if (!value.isObject()) {
        return std::nullopt;
    }

    const QJsonObject object = value.toObject();
    if (object.contains("segments")) {
        return segmentsFromArray(object.value("segments").toArray());
    }
    if (object.contains("transcription")) {
        return segmentsFromArray(object.value("transcription").toArray());
    }
    if (object.value("results").isObject()) {
        const QJsonObject results = object.value("results").toObject();
        if (results.contains("segments")) {
            return segmentsFromArray(results.value("segments").toArray());
        }
    }
    return std::nullopt;
}

std::optional<QList<TranscriptSegment>> WhisperOutputReader::parseJsonLines(const QByteArray& contents) {
    QList<TranscriptSegment> segments;
    for (const QByteArray& rawLine : contents.split('\n')) {
        const QByteArray line = rawLine.trimmed();
        if (line.isEmpty()) {
            continue;
        }
        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &error);
        if (error.error != QJsonParseError::NoError) {
            continue;
        }
        const QJsonValue value = doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(doc.object());
        if (auto list = segmentsFromValue(value)) {
            segments.append(*list);
        } else if (auto segment = segmentFromValue(value)) {
            segments.append(*segment);
        }
    }
    if (segments.isEmpty()) {
        return std::nullopt;
    }
    return segments;
}

QByteArray WhisperOutputReader::normalizeContents(const QByteArray& contents) {
    QByteArray trimmed = contents;
    if (trimmed.startsWith("\xEF\xBB\xBF")) {
        trimmed.remove(0, 3);
    }
    trimmed = trimmed.trimmed();

    const auto objectStart = trimmed.indexOf('{');
    const auto arrayStart = trimmed.indexOf('[');
    qsizetype start = -1;
    if (objectStart >= 0 && arrayStart >= 0) {
        start = std::min(objectStart, arrayStart);
    } else {
        start = objectStart >= 0 ? objectStart : arrayStart;
    }
    const qsizetype end = std::max(trimmed.lastIndexOf('}'), trimmed.lastIndexOf(']'));
    if (start >= 0 && end >= start) {
        return trimmed.mid(start, end - start + 1);
    }
    return trimmed;
}

std::optional<QList<TranscriptSegment>> WhisperOutputReader::parseJson(const QByteArray& contents) {
    const QByteArray normalized = normalizeContents(contents);
    if (normalized.isEmpty()) {
        return std::nullopt;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(normalized, &error);
    if (error.error == QJsonParseError::NoError) {
        const QJsonValue root = doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(doc.object());
        if (auto segments = segmentsFromValue(root)) {
            return segments;
        }
    }

    return parseJsonLines(normalized);
}

Expected<QList<TranscriptSegment>, QString> WhisperOutputReader::read(const QString& outputBase) {
    const QString jsonPath = outputBase + ".json";
    QFile jsonFile(jsonPath);
    if (jsonFile.open(QIODevice::ReadOnly)) {
        if (auto segments = parseJson(jsonFile.readAll())) {
            return *segments;
        }
        SCRIBE_WARN("Could not read segments from {}, trying text output", jsonPath.toStdString());
    } else {
        SCRIBE_WARN("Recognition output {} missing: {}", jsonPath.toStdString(),
                    jsonFile.errorString().toStdString());
    }

    const QString textPath = outputBase + ".txt";
    QFile textFile(textPath);
    if (textFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QStringList lines;
        for (const QString& line : QString::fromUtf8(textFile.readAll()).split('\n')) {
            const QString trimmed = line.trimmed();
            if (!trimmed.isEmpty()) {
                lines << trimmed;
            }
        }
        if (!lines.isEmpty()) {
            TranscriptSegment segment;
            segment.text = lines.join(' ');
            return QList<TranscriptSegment>{segment};
        }
    }

    return makeUnexpected(QStringLiteral("Failed to parse whisper output at %1").arg(jsonPath));
}

} // namespace Scribe
