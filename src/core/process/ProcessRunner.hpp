#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <chrono>
#include <functional>

namespace Scribe {

enum class OutputChannel {
    StandardOutput,
    StandardError
};

struct ProcessCommand {
    QString program;
    QStringList arguments;
    QString workingDirectory;
    std::chrono::milliseconds timeout{0};  // 0 = wait as long as it runs
};

struct ProcessResult {
    int exitCode = -1;
    bool started = false;
    bool crashed = false;
    bool timedOut = false;
    QString errorString;

    bool succeeded() const {
        return started && !crashed && !timedOut && exitCode == 0;
    }
    QString describeFailure() const;
};

/**
 * @brief Runs an external program on the calling thread
 *
 * Output of both channels is split into lines ('\n' or '\r') and handed to
 * the callback in arrival order while the program runs. The call returns
 * when the program exits, crashes, fails to start or times out.
 */
class ProcessRunner {
public:
    using LineHandler = std::function<void(const QString& line, OutputChannel channel)>;

    static ProcessResult run(const ProcessCommand& command, const LineHandler& onLine);

    // Program and arguments quoted for log output.
    static QString commandLine(const ProcessCommand& command);
};

} // namespace Scribe
