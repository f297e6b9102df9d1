#include "MeetingTime.hpp"
#include <QtCore/QStringList>

namespace Scribe {

namespace {

const QChar HOUR_MARK(0x6642);    // 時
const QChar MINUTE_MARK(0x5206);  // 分
const QChar SECOND_MARK(0x79D2);  // 秒

std::optional<QTime> fromParts(const QStringList& parts) {
    if (parts.size() < 2 || parts.size() > 3) {
        return std::nullopt;
    }

    int values[3] = {0, 0, 0};
    for (int i = 0; i < parts.size(); ++i) {
        bool ok = false;
        const QString part = parts.at(i).trimmed();
        values[i] = part.toInt(&ok);
        if (!ok || part.isEmpty() || part.startsWith('-') || part.startsWith('+')) {
            return std::nullopt;
        }
    }

    const QTime time(values[0], values[1], values[2]);
    if (!time.isValid()) {
        return std::nullopt;
    }
    return time;
}

std::optional<QTime> parseJapanese(const QString& value) {
    const auto hourAt = value.indexOf(HOUR_MARK);
    const auto minuteAt = value.indexOf(MINUTE_MARK, hourAt + 1);
    if (hourAt <= 0 || minuteAt < 0 || !value.endsWith(SECOND_MARK)) {
        return std::nullopt;
    }

    const QString hours = value.left(hourAt);
    const QString minutes = value.mid(hourAt + 1, minuteAt - hourAt - 1);
    const QString seconds = value.mid(minuteAt + 1, value.size() - minuteAt - 2);
    return fromParts({hours, minutes, seconds});
}

} // namespace

std::optional<QTime> parseMeetingTime(const QString& value) {
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    if (trimmed.contains(HOUR_MARK) || trimmed.contains(MINUTE_MARK) || trimmed.contains(SECOND_MARK)) {
        return parseJapanese(trimmed);
    }

    const QStringList hyphenParts = trimmed.split('-');
    if (hyphenParts.size() == 3) {
        return fromParts(hyphenParts);
    }

    const QStringList colonParts = trimmed.split(':');
    if (colonParts.size() == 2 || colonParts.size() == 3) {
        return fromParts(colonParts);
    }

    return std::nullopt;
}

int compareTimeStrings(const QString& a, const QString& b) {
    const auto left = parseMeetingTime(a);
    const auto right = parseMeetingTime(b);

    if (left && right) {
        if (*left == *right) {
            return 0;
        }
        return *left < *right ? -1 : 1;
    }
    if (left) {
        return -1;
    }
    if (right) {
        return 1;
    }
    return QString::compare(a, b);
}

int secondsFromMidnight(const QString& value) {
    const auto time = parseMeetingTime(value);
    return time ? QTime(0, 0).secsTo(*time) : 0;
}

QString roomLabelFor(const QString& roomId) {
    static const QString prefix = QStringLiteral("localWorld.");
    if (roomId.startsWith(prefix)) {
        const QString rest = roomId.mid(prefix.size());
        const auto dash = rest.indexOf('-');
        if (dash >= 0 && dash + 1 < rest.size()) {
            return rest.mid(dash + 1);
        }
    }
    return roomId;
}

} // namespace Scribe
