#pragma once

#include <QtCore/QString>
#include <QtCore/QtGlobal>
#include <optional>

namespace Scribe {

// What one line of engine output contributed.
struct ProgressDelta {
    std::optional<double> fraction;  // overall fraction of the current track, 0..1
    QString logLine;                 // trimmed line, empty for blank input
};

/**
 * @brief Turns whisper-cli output lines into progress
 *
 * Understands segment lines "[00:00:01.000 --> 00:00:04.500] text" (and the
 * mm:ss.mmm short form) scaled by the audio duration, and progress lines
 * such as "whisper_print_progress_callback: progress =  40%". The reported
 * fraction never decreases for one parser instance.
 */
class RecognitionOutputParser {
public:
    explicit RecognitionOutputParser(qint64 audioDurationMs = 0);

    void setAudioDuration(qint64 durationMs) { audioDurationMs_ = durationMs; }
    qint64 audioDuration() const { return audioDurationMs_; }

    ProgressDelta parseLine(const QString& line);

    double currentFraction() const { return fraction_; }

    // End time of a segment line in milliseconds.
    static std::optional<qint64> segmentEndMs(const QString& line);
    static std::optional<double> percentage(const QString& line);

private:
    qint64 audioDurationMs_ = 0;
    double fraction_ = 0.0;
};

} // namespace Scribe
