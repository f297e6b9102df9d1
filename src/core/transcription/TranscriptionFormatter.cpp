#include "TranscriptionFormatter.hpp"
#include "../catalog/MeetingTime.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QRegularExpression>
#include <QtCore/QSaveFile>
#include <QtCore/QStringList>
#include <algorithm>

namespace Scribe {

QList<TranscriptSegment> TranscriptionFormatter::mergeTracks(const QList<TrackTranscript>& tracks) {
    QList<TranscriptSegment> merged;

    for (const auto& transcript : tracks) {
        const qint64 offsetMs = static_cast<qint64>(secondsFromMidnight(transcript.track.trackTime)) * 1000;
        for (TranscriptSegment segment : transcript.segments) {
            segment.startTime += offsetMs;
            segment.endTime += offsetMs;
            if (segment.speaker.isEmpty()) {
                segment.speaker = transcript.track.speaker;
            }
            merged.append(segment);
        }
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const TranscriptSegment& a, const TranscriptSegment& b) {
                         return a.startTime < b.startTime;
                     });
    return merged;
}

QString TranscriptionFormatter::convertToPlainText(const QList<TranscriptSegment>& segments,
                                                   const FormatOptions& options) {
    QStringList lines;

    for (const auto& segment : segments) {
        const QString text = removeExtraSpaces(segment.text);
        if (text.isEmpty()) {
            continue;
        }

        QString line;
        if (options.includeTimestamps) {
            line += QStringLiteral("[%1 - %2] ")
                        .arg(formatTimestamp(segment.startTime), formatTimestamp(segment.endTime));
        }
        const QString speaker = segment.speaker.trimmed();
        if (options.includeSpeaker && !speaker.isEmpty()) {
            line += speaker + QStringLiteral(": ");
        }
        line += text;
        lines << line;
    }

    if (lines.isEmpty()) {
        return QString();
    }
    return lines.join('\n') + '\n';
}

QString TranscriptionFormatter::outputPathFor(const QString& outputDir, const QString& meetingId) {
    QString fileName = meetingId;
    fileName.replace('/', '_');
    fileName.replace('\\', '_');
    return QDir(outputDir).filePath(fileName + QStringLiteral(".txt"));
}

Expected<QString, QString> TranscriptionFormatter::writeTranscript(const QString& outputDir,
                                                                   const QString& meetingId,
                                                                   const QString& contents) {
    if (outputDir.trimmed().isEmpty()) {
        return makeUnexpected(QStringLiteral("output directory is not configured"));
    }
    if (!QDir().mkpath(outputDir)) {
        return makeUnexpected(QStringLiteral("cannot create output directory %1").arg(outputDir));
    }

    const QString path = outputPathFor(outputDir, meetingId);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return makeUnexpected(QStringLiteral("cannot open %1: %2").arg(path, file.errorString()));
    }

    const QByteArray data = contents.toUtf8();
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        return makeUnexpected(QStringLiteral("cannot write %1: %2").arg(path, file.errorString()));
    }
    if (!file.commit()) {
        return makeUnexpected(QStringLiteral("cannot commit %1: %2").arg(path, file.errorString()));
    }

    SCRIBE_INFO("Transcript written to {} ({} bytes)", path.toStdString(), data.size());
    return path;
}

QString TranscriptionFormatter::formatTimestamp(qint64 milliseconds) {
    if (milliseconds < 0) milliseconds = 0;

    const qint64 totalSeconds = milliseconds / 1000;
    const qint64 secs = totalSeconds % 60;
    const qint64 mins = (totalSeconds / 60) % 60;
    const qint64 hours = totalSeconds / 3600;

    return QString("%1:%2:%3")
           .arg(hours, 2, 10, QChar('0'))
           .arg(mins, 2, 10, QChar('0'))
           .arg(secs, 2, 10, QChar('0'));
}

QString TranscriptionFormatter::removeExtraSpaces(const QString& text) {
    QString cleaned = text;
    cleaned.replace(QRegularExpression(R"(\s+)"), " ");
    return cleaned.trimmed();
}

} // namespace Scribe
