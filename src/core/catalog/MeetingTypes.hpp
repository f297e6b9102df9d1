#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QString>

namespace Scribe {

struct MeetingSummary {
    QString id;           // <date>/<roomId>/<meetingTime>
    QString date;
    QString roomId;
    QString roomLabel;
    QString meetingTime;
    int speakerCount = 0;
    int trackCount = 0;

    QJsonObject toJson() const;
    bool operator==(const MeetingSummary& other) const;
};

// One audio object belonging to a meeting.
struct TrackEntry {
    QString key;
    QString speaker;      // empty when the key has no speaker partition
    QString trackTime;    // file name prefix before the first '_'
};

// The components of an accepted object key.
struct ObjectKeyParts {
    QString date;
    QString roomId;
    QString meetingTime;
    QString speaker;
    QString fileName;
    QString trackTime;
};

struct MeetingRef {
    QString date;
    QString roomId;
    QString meetingTime;
};

} // namespace Scribe
