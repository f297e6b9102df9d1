#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>
#include <QtCore/QList>
#include <QtCore/QString>
#include <optional>
#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"

namespace Scribe {

/**
 * @brief Reads the files whisper-cli writes for "-oj -otxt -of <base>"
 *
 * JSON shapes accepted: {"segments": [...]}, {"transcription": [...]},
 * {"results": {"segments": [...]}}, a bare array and one object per line.
 * Segment times come from "start"/"end" (seconds), "offsets" (ms),
 * "timestamps" ("HH:MM:SS,mmm") or "t0"/"t1" (centiseconds). When no JSON
 * segment can be read, the non-empty lines of <base>.txt become one segment.
 */
class WhisperOutputReader {
public:
    static Expected<QList<TranscriptSegment>, QString> read(const QString& outputBase);

    static std::optional<QList<TranscriptSegment>> parseJson(const QByteArray& contents);
    static std::optional<qint64> parseTimestampMs(const QString& value);

private:
    static std::optional<QList<TranscriptSegment>> segmentsFromValue(const QJsonValue& value);
    static std::optional<QList<TranscriptSegment>> segmentsFromArray(const QJsonArray& items);
    static std::optional<TranscriptSegment> segmentFromValue(const QJsonValue& value);
    static std::optional<QList<TranscriptSegment>> parseJsonLines(const QByteArray& contents);
    static QByteArray normalizeContents(const QByteArray& contents);
};

} // namespace Scribe
