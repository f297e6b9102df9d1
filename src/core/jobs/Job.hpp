#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>
#include "../common/OrchestratorError.hpp"

namespace Scribe {

enum class JobState {
    Pending,       // created, not yet fetching
    Downloading,   // fetch stage
    Running,       // extract, recognize and format stages
    Completed,
    Failed
};

// "pending", "downloading", "running", "completed", "failed"
QString jobStateName(JobState state);
bool isTerminalState(JobState state);

struct JobSnapshot {
    QString jobId;
    QString meetingId;
    JobState state = JobState::Pending;
    int completed = 0;
    int total = 0;
    QString outputPath;                  // set only when completed
    QString error;                       // set only when failed
    std::optional<ErrorCode> errorCode;  // set only when failed
    QStringList log;
    QDateTime createdAt;
    QDateTime finishedAt;

    bool isTerminal() const { return isTerminalState(state); }
    QJsonObject toJson() const;
};

/**
 * @brief The mutable record behind a job
 *
 * Not synchronized; JobManager guards it. The mutators keep the invariants:
 * state never regresses and never leaves a terminal state, completed never
 * decreases and stays within total once total is known, outputPath and
 * error appear only together with their terminal state.
 */
class JobRecord {
public:
    JobRecord(QString jobId, QString meetingId);

    const JobSnapshot& snapshot() const { return snapshot_; }

    // Moves forward to a non-terminal state; returns false when that would regress.
    bool advanceTo(JobState state);

    void setTotal(int total);
    void setCompleted(int completed);
    void appendLog(const QString& line);

    // Terminal transitions; ignored once the job is terminal.
    bool complete(const QString& outputPath);
    bool fail(ErrorCode code, const QString& message);

private:
    JobSnapshot snapshot_;
};

} // namespace Scribe
