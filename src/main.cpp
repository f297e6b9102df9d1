#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QStandardPaths>
#include <QtCore/QTextStream>
#include <QtCore/QThread>

#include "controllers/AppController.hpp"
#include "core/common/Logger.hpp"

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr unsigned long POLL_INTERVAL_MS = 500;

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

int reportError(const Scribe::OrchestratorError& error) {
    err() << error.toString() << Qt::endl;
    return EXIT_FAILED;
}

void printJson(const QJsonDocument& doc) {
    out() << doc.toJson(QJsonDocument::Indented);
    out().flush();
}

int runDates(Scribe::AppController& controller, bool json) {
    auto dates = controller.listDates();
    if (dates.hasError()) {
        return reportError(dates.error());
    }
    if (json) {
        printJson(QJsonDocument(QJsonArray::fromStringList(dates.value())));
        return EXIT_OK;
    }
    for (const QString& date : dates.value()) {
        out() << date << Qt::endl;
    }
    return EXIT_OK;
}

int runMeetings(Scribe::AppController& controller, const QString& date, bool json) {
    auto meetings = controller.listMeetings(date);
    if (meetings.hasError()) {
        return reportError(meetings.error());
    }
    if (json) {
        QJsonArray array;
        for (const auto& meeting : meetings.value()) {
            array.append(meeting.toJson());
        }
        printJson(QJsonDocument(array));
        return EXIT_OK;
    }
    for (const auto& meeting : meetings.value()) {
        out() << meeting.id << '\t' << meeting.roomLabel << '\t' << meeting.meetingTime
              << '\t' << meeting.speakerCount << " speaker(s), " << meeting.trackCount << " track(s)"
              << Qt::endl;
    }
    return EXIT_OK;
}

int runTranscribe(Scribe::AppController& controller, const QString& meetingId) {
    auto jobId = controller.startTranscribe(meetingId);
    if (jobId.hasError()) {
        return reportError(jobId.error());
    }
    err() << "Job " << jobId.value() << " started" << Qt::endl;

    int printedLines = 0;
    int lastCompleted = -1;
    for (;;) {
        auto status = controller.transcribeStatus(jobId.value());
        if (status.hasError()) {
            return reportError(status.error());
        }
        const Scribe::JobSnapshot& job = status.value();

        for (; printedLines < job.log.size(); ++printedLines) {
            err() << job.log.at(printedLines) << Qt::endl;
        }
        if (job.total > 0 && job.completed != lastCompleted) {
            lastCompleted = job.completed;
            err() << "[" << Scribe::jobStateName(job.state) << "] "
                  << (job.completed * 100 / job.total) << "%" << Qt::endl;
        }

        if (job.state == Scribe::JobState::Completed) {
            out() << job.outputPath << Qt::endl;
            return EXIT_OK;
        }
        if (job.state == Scribe::JobState::Failed) {
            err() << job.error << Qt::endl;
            return EXIT_FAILED;
        }
        QThread::msleep(POLL_INTERVAL_MS);
    }
}

int runCheck(Scribe::AppController& controller, bool json) {
    const Scribe::Health health = controller.checkMinio();
    if (json) {
        printJson(QJsonDocument(health.toJson()));
    } else if (health.reachable) {
        out() << "reachable" << Qt::endl;
    } else {
        out() << "unreachable (" << Scribe::healthTagName(health.tag) << "): " << health.reason << Qt::endl;
    }
    return health.reachable ? EXIT_OK : EXIT_FAILED;
}

int runConfig(Scribe::AppController& controller, const QStringList& args) {
    if (args.size() <= 1) {
        printJson(QJsonDocument(controller.config().toJson()));
        return EXIT_OK;
    }
    if (args.at(1) != "set" || args.size() != 4) {
        err() << "usage: scribe config [set <section.key> <value>]" << Qt::endl;
        return EXIT_USAGE;
    }

    Scribe::AppConfig config = controller.config();
    if (!Scribe::applyConfigValue(config, args.at(2), args.at(3))) {
        return reportError(Scribe::OrchestratorError(
            Scribe::ErrorCode::InvalidArgument,
            QStringLiteral("Unknown setting or bad value: %1=%2").arg(args.at(2), args.at(3))));
    }
    controller.setConfig(config);

    auto flushed = controller.flushConfig();
    if (flushed.hasError()) {
        return reportError(flushed.error());
    }
    out() << "Saved " << controller.configPath() << Qt::endl;
    return EXIT_OK;
}

int runDefaults(Scribe::AppController& controller) {
    auto print = [](const char* name, const std::optional<QString>& value) {
        out() << name << ": " << value.value_or(QStringLiteral("<not found>")) << Qt::endl;
    };
    print("whisper", controller.defaultWhisperBinary());
    print("ffmpeg", controller.defaultFfmpegBinary());
    print("modelRoot", controller.defaultWhisperModelRoot());
    print("outputDir", controller.defaultOutputDir());
    return EXIT_OK;
}

QString logFilePath() {
    const QString dir = QDir(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation))
                            .filePath(QStringLiteral("logs"));
    if (!QDir().mkpath(dir)) {
        return QString();
    }
    return QDir(dir).filePath(QStringLiteral("scribe.log"));
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ScribeDesktop");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Scribe");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Browse recorded meetings in an object store and transcribe them with whisper.cpp.\n\n"
        "Commands:\n"
        "  dates                          list recording dates, most recent first\n"
        "  meetings <date>                list the meetings of a date\n"
        "  transcribe <meetingId>         transcribe a meeting and wait for the result\n"
        "  check                          verify the object store and bucket are reachable\n"
        "  config                         print the configuration\n"
        "  config set <section.key> <v>   change one setting\n"
        "  defaults                       print the located default locations");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(QStringList{"c", "config"}, "Configuration file to use.", "file");
    QCommandLineOption verboseOption(QStringList{"v", "verbose"}, "Log debug output to stderr.");
    QCommandLineOption jsonOption("json", "Print results as JSON.");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addOption(jsonOption);
    parser.addPositionalArgument("command", "dates | meetings | transcribe | check | config | defaults");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(EXIT_USAGE);
    }

    const QString path = logFilePath();
    Scribe::Logger::instance().initialize(path.toStdString(),
                                          parser.isSet(verboseOption) ? Scribe::Logger::Level::Debug
                                                                      : Scribe::Logger::Level::Warn);
    SCRIBE_INFO("Starting Scribe v{}", app.applicationVersion().toStdString());

    try {
        Scribe::AppController::Options options;
        options.configPath = parser.value(configOption);
        Scribe::AppController controller(std::move(options));

        const QString command = args.first();
        const bool json = parser.isSet(jsonOption);

        if (command == "dates") {
            return runDates(controller, json);
        }
        if (command == "meetings" && args.size() == 2) {
            return runMeetings(controller, args.at(1), json);
        }
        if (command == "transcribe" && args.size() == 2) {
            return runTranscribe(controller, args.at(1));
        }
        if (command == "check") {
            return runCheck(controller, json);
        }
        if (command == "config") {
            return runConfig(controller, args);
        }
        if (command == "defaults") {
            return runDefaults(controller);
        }

        err() << "Unknown command or wrong arguments: " << args.join(' ') << Qt::endl;
        return EXIT_USAGE;

    } catch (const std::exception& e) {
        SCRIBE_CRITICAL("Fatal error: {}", e.what());
        return EXIT_FAILED;
    }
}
