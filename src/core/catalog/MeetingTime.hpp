#pragma once

#include <QtCore/QString>
#include <QtCore/QTime>
#include <optional>

namespace Scribe {

// Accepts "HH-MM-SS", "H時M分S秒" and "HH:MM[:SS]".
std::optional<QTime> parseMeetingTime(const QString& value);

// Parsed times order chronologically and before unparseable ones; two
// unparseable values compare lexicographically. Returns <0, 0 or >0.
int compareTimeStrings(const QString& a, const QString& b);

// Seconds since midnight, or 0 when the value does not parse.
int secondsFromMidnight(const QString& value);

// "localWorld.<n>-<label>" yields <label>; anything else is returned as is.
QString roomLabelFor(const QString& roomId);

} // namespace Scribe
