#pragma once

#include <QtCore/QList>
#include <QtCore/QStringList>
#include <optional>
#include "MeetingTypes.hpp"
#include "../common/Expected.hpp"
#include "../common/OrchestratorError.hpp"
#include "../storage/ObjectStore.hpp"

namespace Scribe {

/**
 * @brief Derives dates, meetings and audio tracks from object keys
 *
 * Accepted key shapes:
 *   <date>/<room>/<time>/<file>
 *   <date>/<room>/<time>/<speaker>/<file>
 * Anything else is ignored. The catalog holds no state of its own; every
 * call lists the store again.
 */
class MeetingCatalog {
public:
    explicit MeetingCatalog(ObjectStore& store);

    // Distinct top-level partitions, most recent first.
    Expected<QStringList, OrchestratorError> listDates();

    // Ordered by room id, then meeting time.
    Expected<QList<MeetingSummary>, OrchestratorError> listMeetings(const QString& date);

    // Audio objects of one meeting ordered by track time.
    Expected<QList<TrackEntry>, OrchestratorError> resolveTracks(const QString& meetingId);

    static QString deriveMeetingId(const QString& date, const QString& roomId, const QString& meetingTime);
    static std::optional<MeetingRef> parseMeetingId(const QString& meetingId);
    static std::optional<ObjectKeyParts> parseObjectKey(const QString& key);

    // Groups keys into summaries; keys outside date are skipped.
    static QList<MeetingSummary> summarize(const QString& date, const QStringList& keys);

private:
    ObjectStore& store_;
};

} // namespace Scribe
