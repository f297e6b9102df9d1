#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include "TranscriptionTypes.hpp"
#include "../catalog/MeetingTypes.hpp"
#include "../common/Expected.hpp"

namespace Scribe {

struct FormatOptions {
    bool includeTimestamps = false;
    bool includeSpeaker = true;
};

// Segments recognized from one audio track.
struct TrackTranscript {
    TrackEntry track;
    QList<TranscriptSegment> segments;
};

/**
 * @brief Renders recognized segments into the transcript text file
 *
 * One line per segment:
 *   [HH:MM:SS - HH:MM:SS] speaker: text
 * The time range appears only with includeTimestamps, the speaker only with
 * includeSpeaker and when the segment has one.
 */
class TranscriptionFormatter {
public:
    /**
     * @brief Merge the tracks of a meeting into one timeline
     *
     * Each track's segments are shifted by the track's start time (seconds from
     * midnight of its trackTime, 0 when it does not parse). Segments without a
     * speaker take the track's speaker. Ordered by start time; ties keep track
     * order.
     */
    static QList<TranscriptSegment> mergeTracks(const QList<TrackTranscript>& tracks);

    static QString convertToPlainText(const QList<TranscriptSegment>& segments,
                                      const FormatOptions& options);

    // <outputDir>/<meeting id with '/' and '\' replaced by '_'>.txt
    static QString outputPathFor(const QString& outputDir, const QString& meetingId);

    // Writes contents, creating outputDir when needed. Returns the file path.
    static Expected<QString, QString> writeTranscript(const QString& outputDir,
                                                      const QString& meetingId,
                                                      const QString& contents);

    // HH:MM:SS, hours not wrapped at 24
    static QString formatTimestamp(qint64 milliseconds);

private:
    static QString removeExtraSpaces(const QString& text);
};

} // namespace Scribe
