#include "Job.hpp"
#include <QtCore/QJsonArray>
#include <algorithm>

namespace Scribe {

QString jobStateName(JobState state) {
    switch (state) {
        case JobState::Pending: return QStringLiteral("pending");
        case JobState::Downloading: return QStringLiteral("downloading");
        case JobState::Running: return QStringLiteral("running");
        case JobState::Completed: return QStringLiteral("completed");
        case JobState::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}

bool isTerminalState(JobState state) {
    return state == JobState::Completed || state == JobState::Failed;
}

QJsonObject JobSnapshot::toJson() const {
    QJsonObject json;
    json["jobId"] = jobId;
    json["meetingId"] = meetingId;
    json["state"] = jobStateName(state);
    json["completed"] = completed;
    json["total"] = total;
    json["outputPath"] = outputPath.isEmpty() ? QJsonValue() : QJsonValue(outputPath);
    json["error"] = error.isEmpty() ? QJsonValue() : QJsonValue(error);
    if (errorCode) {
        json["errorCode"] = errorCodeName(*errorCode);
    }
    json["log"] = QJsonArray::fromStringList(log);
    json["createdAt"] = createdAt.toString(Qt::ISODateWithMs);
    if (finishedAt.isValid()) {
        json["finishedAt"] = finishedAt.toString(Qt::ISODateWithMs);
    }
    return json;
}

JobRecord::JobRecord(QString jobId, QString meetingId) {
    snapshot_.jobId = std::move(jobId);
    snapshot_.meetingId = std::move(meetingId);
    snapshot_.createdAt = QDateTime::currentDateTimeUtc();
}

bool JobRecord::advanceTo(JobState state) {
    if (snapshot_.isTerminal() || isTerminalState(state)) {
        return false;
    }
    if (static_cast<int>(state) < static_cast<int>(snapshot_.state)) {
        return false;
    }
    snapshot_.state = state;
    return true;
}

void JobRecord::setTotal(int total) {
    if (snapshot_.isTerminal() || total < 0) {
        return;
    }
    snapshot_.total = std::max(snapshot_.total, total);
    if (snapshot_.total > 0) {
        snapshot_.completed = std::min(snapshot_.completed, snapshot_.total);
    }
}

void JobRecord::setCompleted(int completed) {
    if (snapshot_.isTerminal()) {
        return;
    }
    if (snapshot_.total > 0) {
        completed = std::min(completed, snapshot_.total);
    }
    snapshot_.completed = std::max(snapshot_.completed, completed);
}

void JobRecord::appendLog(const QString& line) {
    snapshot_.log.append(line);
}

bool JobRecord::complete(const QString& outputPath) {
    if (snapshot_.isTerminal() || outputPath.isEmpty()) {
        return false;
    }
    snapshot_.outputPath = outputPath;
    if (snapshot_.total > 0) {
        snapshot_.completed = snapshot_.total;
    }
    snapshot_.state = JobState::Completed;
    snapshot_.finishedAt = QDateTime::currentDateTimeUtc();
    return true;
}

bool JobRecord::fail(ErrorCode code, const QString& message) {
    if (snapshot_.isTerminal()) {
        return false;
    }
    snapshot_.error = message.isEmpty() ? errorCodeName(code) : message;
    snapshot_.errorCode = code;
    snapshot_.state = JobState::Failed;
    snapshot_.finishedAt = QDateTime::currentDateTimeUtc();
    return true;
}

} // namespace Scribe
