#include "ProcessRunner.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QEventLoop>
#include <QtCore/QProcess>
#include <QtCore/QTimer>

namespace Scribe {

namespace {

class LineSplitter {
public:
    LineSplitter(OutputChannel channel, const ProcessRunner::LineHandler& onLine)
        : channel_(channel), onLine_(onLine) {}

    void feed(const QByteArray& data) {
        buffer_.append(data);
        qsizetype start = 0;
        for (qsizetype i = 0; i < buffer_.size(); ++i) {
            const char c = buffer_.at(i);
            if (c == '\n' || c == '\r') {
                emitLine(buffer_.mid(start, i - start));
                start = i + 1;
            }
        }
        buffer_.remove(0, start);
    }

    void flush() {
        if (!buffer_.isEmpty()) {
            emitLine(buffer_);
            buffer_.clear();
        }
    }

private:
    void emitLine(const QByteArray& raw) {
        if (raw.trimmed().isEmpty() || !onLine_) {
            return;
        }
        onLine_(QString::fromUtf8(raw), channel_);
    }

    OutputChannel channel_;
    const ProcessRunner::LineHandler& onLine_;
    QByteArray buffer_;
};

} // namespace

QString ProcessResult::describeFailure() const {
    if (!started) {
        return QStringLiteral("failed to start (%1)").arg(errorString);
    }
    if (timedOut) {
        return QStringLiteral("timed out");
    }
    if (crashed) {
        return QStringLiteral("crashed (%1)").arg(errorString);
    }
    return QStringLiteral("exited with code %1").arg(exitCode);
}

QString ProcessRunner::commandLine(const ProcessCommand& command) {
    QStringList parts{command.program};
    for (const QString& argument : command.arguments) {
        parts << (argument.contains(' ') ? QStringLiteral("\"%1\"").arg(argument) : argument);
    }
    return parts.join(' ');
}

ProcessResult ProcessRunner::run(const ProcessCommand& command, const LineHandler& onLine) {
    ProcessResult result;

    QProcess process;
    process.setProgram(command.program);
    process.setArguments(command.arguments);
    if (!command.workingDirectory.isEmpty()) {
        process.setWorkingDirectory(command.workingDirectory);
    }

    LineSplitter stdoutLines(OutputChannel::StandardOutput, onLine);
    LineSplitter stderrLines(OutputChannel::StandardError, onLine);

    QEventLoop loop;
    QObject::connect(&process, &QProcess::readyReadStandardOutput, &loop, [&]() {
        stdoutLines.feed(process.readAllStandardOutput());
    });
    QObject::connect(&process, &QProcess::readyReadStandardError, &loop, [&]() {
        stderrLines.feed(process.readAllStandardError());
    });
    QObject::connect(&process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
                     &loop, &QEventLoop::quit);
    QObject::connect(&process, &QProcess::errorOccurred, &loop, [&](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            loop.quit();
        }
    });

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, [&]() {
        result.timedOut = true;
        loop.quit();
    });

    SCRIBE_DEBUG("Starting: {}", commandLine(command).toStdString());
    process.start(QIODevice::ReadOnly);
    if (command.timeout.count() > 0) {
        timeoutTimer.start(static_cast<int>(command.timeout.count()));
    }

    if (process.state() != QProcess::NotRunning || process.error() != QProcess::FailedToStart) {
        loop.exec();
    }

    if (process.error() == QProcess::FailedToStart) {
        result.errorString = process.errorString();
        SCRIBE_ERROR("{} failed to start: {}", command.program.toStdString(), result.errorString.toStdString());
        return result;
    }
    result.started = true;

    if (result.timedOut) {
        process.kill();
        process.waitForFinished(5000);
        SCRIBE_ERROR("{} timed out after {} ms", command.program.toStdString(),
                     static_cast<long long>(command.timeout.count()));
        return result;
    }

    stdoutLines.feed(process.readAllStandardOutput());
    stderrLines.feed(process.readAllStandardError());
    stdoutLines.flush();
    stderrLines.flush();

    result.crashed = process.exitStatus() == QProcess::CrashExit;
    result.exitCode = process.exitCode();
    if (result.crashed) {
        result.errorString = process.errorString();
    }

    SCRIBE_DEBUG("{} finished: exit code {}, {}", command.program.toStdString(), result.exitCode,
                 result.crashed ? "crashed" : "normal exit");
    return result;
}

} // namespace Scribe
