#include "MeetingCatalog.hpp"
#include "MeetingTime.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QHash>
#include <QtCore/QSet>
#include <algorithm>
#include <functional>

namespace Scribe {

namespace {

OrchestratorError catalogError(const QString& operation, const StoreFailure& failure) {
    return OrchestratorError(ErrorCode::CatalogError,
                             QStringLiteral("%1 failed: %2").arg(operation, describeFailure(failure)));
}

QString stripExtension(const QString& fileName) {
    const auto dot = fileName.lastIndexOf('.');
    return dot >= 0 ? fileName.left(dot) : fileName;
}

} // namespace

QJsonObject MeetingSummary::toJson() const {
    QJsonObject json;
    json["id"] = id;
    json["date"] = date;
    json["roomId"] = roomId;
    json["roomLabel"] = roomLabel;
    json["meetingTime"] = meetingTime;
    json["speakerCount"] = speakerCount;
    json["trackCount"] = trackCount;
    return json;
}

bool MeetingSummary::operator==(const MeetingSummary& other) const {
    return id == other.id && date == other.date && roomId == other.roomId &&
           roomLabel == other.roomLabel && meetingTime == other.meetingTime &&
           speakerCount == other.speakerCount && trackCount == other.trackCount;
}

MeetingCatalog::MeetingCatalog(ObjectStore& store)
    : store_(store) {
}

QString MeetingCatalog::deriveMeetingId(const QString& date, const QString& roomId, const QString& meetingTime) {
    return date + "/" + roomId + "/" + meetingTime;
}

std::optional<MeetingRef> MeetingCatalog::parseMeetingId(const QString& meetingId) {
    const QStringList parts = meetingId.trimmed().split('/');
    if (parts.size() != 3) {
        return std::nullopt;
    }
    for (const QString& part : parts) {
        if (part.isEmpty()) {
            return std::nullopt;
        }
    }
    return MeetingRef{parts.at(0), parts.at(1), parts.at(2)};
}

std::optional<ObjectKeyParts> MeetingCatalog::parseObjectKey(const QString& key) {
    const QStringList parts = key.split('/');
    if (parts.size() != 4 && parts.size() != 5) {
        return std::nullopt;
    }
    for (const QString& part : parts) {
        if (part.isEmpty()) {
            return std::nullopt;
        }
    }

    ObjectKeyParts parsed;
    parsed.date = parts.at(0);
    parsed.roomId = parts.at(1);
    parsed.meetingTime = parts.at(2);
    if (parts.size() == 5) {
        parsed.speaker = parts.at(3);
    }
    parsed.fileName = parts.last();

    const QString stem = stripExtension(parsed.fileName);
    const auto underscore = stem.indexOf('_');
    parsed.trackTime = underscore >= 0 ? stem.left(underscore) : stem;
    // ".ogg" or "_mic.wav" carry no track time
    if (parsed.trackTime.isEmpty()) {
        return std::nullopt;
    }
    return parsed;
}

Expected<QStringList, OrchestratorError> MeetingCatalog::listDates() {
    auto delimited = store_.listObjects(QString(), QStringLiteral("/"));
    if (delimited.hasError()) {
        SCRIBE_ERROR("Listing dates failed: {}", describeFailure(delimited.error()).toStdString());
        return makeUnexpected(catalogError("Listing dates", delimited.error()));
    }

    QSet<QString> unique;
    for (QString prefix : delimited.value().commonPrefixes) {
        while (prefix.endsWith('/')) {
            prefix.chop(1);
        }
        if (!prefix.isEmpty()) {
            unique.insert(prefix);
        }
    }

    // Stores that ignore the delimiter only return keys
    if (delimited.value().commonPrefixes.isEmpty()) {
        auto flat = store_.listObjects(QString());
        if (flat.hasError()) {
            SCRIBE_ERROR("Listing objects failed: {}", describeFailure(flat.error()).toStdString());
            return makeUnexpected(catalogError("Listing dates", flat.error()));
        }
        for (const QString& key : flat.value().keys) {
            const QString first = key.section('/', 0, 0);
            if (!first.isEmpty()) {
                unique.insert(first);
            }
        }
    }

    QStringList dates(unique.begin(), unique.end());
    std::sort(dates.begin(), dates.end(), std::greater<QString>());
    SCRIBE_DEBUG("Found {} date partition(s)", dates.size());
    return dates;
}

QList<MeetingSummary> MeetingCatalog::summarize(const QString& date, const QStringList& keys) {
    struct Group {
        MeetingSummary summary;
        QSet<QString> speakers;
    };
    QHash<QString, Group> groups;

    for (const QString& key : keys) {
        const auto parsed = parseObjectKey(key);
        if (!parsed || parsed->date != date) {
            continue;
        }

        const QString id = deriveMeetingId(parsed->date, parsed->roomId, parsed->meetingTime);
        auto it = groups.find(id);
        if (it == groups.end()) {
            Group group;
            group.summary.id = id;
            group.summary.date = parsed->date;
            group.summary.roomId = parsed->roomId;
            group.summary.roomLabel = roomLabelFor(parsed->roomId);
            group.summary.meetingTime = parsed->meetingTime;
            it = groups.insert(id, group);
        }

        it->summary.trackCount++;
        if (!parsed->speaker.isEmpty()) {
            it->speakers.insert(parsed->speaker);
        }
    }

    QList<MeetingSummary> meetings;
    meetings.reserve(groups.size());
    for (auto it = groups.cbegin(); it != groups.cend(); ++it) {
        MeetingSummary summary = it->summary;
        summary.speakerCount = static_cast<int>(it->speakers.size());
        meetings.append(summary);
    }

    std::sort(meetings.begin(), meetings.end(), [](const MeetingSummary& a, const MeetingSummary& b) {
        if (a.roomId != b.roomId) {
            return a.roomId < b.roomId;
        }
        const int byTime = compareTimeStrings(a.meetingTime, b.meetingTime);
        if (byTime != 0) {
            return byTime < 0;
        }
        return a.meetingTime < b.meetingTime;
    });

    return meetings;
}

Expected<QList<MeetingSummary>, OrchestratorError> MeetingCatalog::listMeetings(const QString& date) {
    QString trimmed = date.trimmed();
    while (trimmed.endsWith('/')) {
        trimmed.chop(1);
    }
    if (trimmed.isEmpty() || trimmed.contains('/')) {
        return makeUnexpected(OrchestratorError(ErrorCode::InvalidArgument,
                                                QStringLiteral("Invalid date '%1'").arg(date)));
    }

    auto listing = store_.listObjects(trimmed + "/");
    if (listing.hasError()) {
        SCRIBE_ERROR("Listing meetings for {} failed: {}",
                     trimmed.toStdString(), describeFailure(listing.error()).toStdString());
        return makeUnexpected(catalogError("Listing meetings", listing.error()));
    }

    auto meetings = summarize(trimmed, listing.value().keys);
    SCRIBE_DEBUG("Date {} has {} meeting(s)", trimmed.toStdString(), meetings.size());
    return meetings;
}

Expected<QList<TrackEntry>, OrchestratorError> MeetingCatalog::resolveTracks(const QString& meetingId) {
    const auto ref = parseMeetingId(meetingId);
    if (!ref) {
        return makeUnexpected(OrchestratorError(ErrorCode::InvalidArgument,
                                                QStringLiteral("Invalid meeting id '%1'").arg(meetingId)));
    }

    const QString prefix = deriveMeetingId(ref->date, ref->roomId, ref->meetingTime) + "/";
    auto listing = store_.listObjects(prefix);
    if (listing.hasError()) {
        return makeUnexpected(catalogError("Listing tracks", listing.error()));
    }

    QList<TrackEntry> tracks;
    for (const QString& key : listing.value().keys) {
        const auto parsed = parseObjectKey(key);
        if (!parsed || parsed->date != ref->date || parsed->roomId != ref->roomId ||
            parsed->meetingTime != ref->meetingTime) {
            continue;
        }
        tracks.append(TrackEntry{key, parsed->speaker, parsed->trackTime});
    }

    std::sort(tracks.begin(), tracks.end(), [](const TrackEntry& a, const TrackEntry& b) {
        const int byTime = compareTimeStrings(a.trackTime, b.trackTime);
        if (byTime != 0) {
            return byTime < 0;
        }
        return a.key < b.key;
    });

    return tracks;
}

} // namespace Scribe
