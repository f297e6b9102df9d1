#include "RecognitionOutputParser.hpp"
#include <QtCore/QRegularExpression>
#include <algorithm>

namespace Scribe {

namespace {

// [hh:mm:ss.mmm --> hh:mm:ss.mmm]
const char* const LONG_SEGMENT_PATTERN =
    R"(\[\s*\d+:\d{2}:\d{2}[.,]\d{3}\s*-->\s*(\d+):(\d{2}):(\d{2})[.,](\d{3})\s*\])";
// [mm:ss.mmm --> mm:ss.mmm]
const char* const SHORT_SEGMENT_PATTERN =
    R"(\[\s*\d+:\d{2}[.,]\d{3}\s*-->\s*(\d+):(\d{2})[.,](\d{3})\s*\])";
const char* const PERCENT_PATTERN = R"(progress\s*[=:]\s*(\d+(?:\.\d+)?)\s*%)";

} // namespace

RecognitionOutputParser::RecognitionOutputParser(qint64 audioDurationMs)
    : audioDurationMs_(audioDurationMs) {
}

std::optional<qint64> RecognitionOutputParser::segmentEndMs(const QString& line) {
    static const QRegularExpression longPattern(QString::fromLatin1(LONG_SEGMENT_PATTERN));
    static const QRegularExpression shortPattern(QString::fromLatin1(SHORT_SEGMENT_PATTERN));

    const QRegularExpressionMatch longMatch = longPattern.match(line);
    if (longMatch.hasMatch()) {
        const qint64 hours = longMatch.captured(1).toLongLong();
        const qint64 minutes = longMatch.captured(2).toLongLong();
        const qint64 seconds = longMatch.captured(3).toLongLong();
        const qint64 millis = longMatch.captured(4).toLongLong();
        return ((hours * 60 + minutes) * 60 + seconds) * 1000 + millis;
    }

    const QRegularExpressionMatch shortMatch = shortPattern.match(line);
    if (shortMatch.hasMatch()) {
        const qint64 minutes = shortMatch.captured(1).toLongLong();
        const qint64 seconds = shortMatch.captured(2).toLongLong();
        const qint64 millis = shortMatch.captured(3).toLongLong();
        return (minutes * 60 + seconds) * 1000 + millis;
    }

    return std::nullopt;
}

std::optional<double> RecognitionOutputParser::percentage(const QString& line) {
    static const QRegularExpression percentPattern(QString::fromLatin1(PERCENT_PATTERN),
                                                   QRegularExpression::CaseInsensitiveOption);

    const QRegularExpressionMatch match = percentPattern.match(line);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = match.captured(1).toDouble(&ok);
    if (!ok || value < 0.0 || value > 100.0) {
        return std::nullopt;
    }
    return value;
}

ProgressDelta RecognitionOutputParser::parseLine(const QString& line) {
    ProgressDelta delta;
    delta.logLine = line.trimmed();
    if (delta.logLine.isEmpty()) {
        return delta;
    }

    std::optional<double> candidate;
    if (auto percent = percentage(delta.logLine)) {
        candidate = *percent / 100.0;
    } else if (auto endMs = segmentEndMs(delta.logLine)) {
        if (audioDurationMs_ > 0) {
            candidate = static_cast<double>(*endMs) / static_cast<double>(audioDurationMs_);
        }
    }

    if (candidate) {
        const double bounded = std::clamp(*candidate, 0.0, 1.0);
        if (bounded > fraction_) {
            fraction_ = bounded;
            delta.fraction = fraction_;
        }
    }

    return delta;
}

} // namespace Scribe
