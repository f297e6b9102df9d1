#include <QtTest/QtTest>
#include <QtCore/QDir>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QScopeGuard>
#include <QtCore/QSemaphore>
#include <QtTest/QSignalSpy>

#include "utils/TestUtils.hpp"
#include "utils/MockComponents.hpp"
#include "../src/controllers/AppController.hpp"

using namespace Scribe;
using namespace Scribe::Test;

/**
 * @brief End-to-end tests driving the controller the way a client does
 *
 * Browses the catalog, configures the toolchain, starts a transcription
 * and polls it to completion against an in-memory object store and
 * scripted stand-ins for ffmpeg and whisper-cli.
 */
class TestEndToEndIntegration : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testBrowseAndTranscribeMeeting();
    void testSecondTranscriptionRejectedWhileRunning();
    void testFailedTranscriptionReportsStage();
    void testConfigurationPersistsAcrossRestarts();
    void testFailedConfigWriteIsReported();
    void testUnreachableObjectStore();
    void testDefaultsComeFromLocator();

private:
    AppController::Options options() const;
    AppConfig toolchainConfig() const;
    JobSnapshot waitForTerminal(AppController& controller, const QString& jobId) const;

    QString tempDir_;
    QString configPath_;
    QString outputDir_;
    FakeToolchain toolchain_;
    std::shared_ptr<InMemoryObjectStore> store_;
    std::shared_ptr<FixedDefaultsLocator> locator_;
};

void TestEndToEndIntegration::init() {
    tempDir_ = TestUtils::createTempDirectory("end_to_end");
    configPath_ = QDir(tempDir_).filePath("config/config.json");
    outputDir_ = QDir(tempDir_).filePath("transcripts");
    toolchain_ = FakeToolchain();
    store_ = std::make_shared<InMemoryObjectStore>();
    locator_ = std::make_shared<FixedDefaultsLocator>();
}

void TestEndToEndIntegration::cleanup() {
    TestUtils::cleanupTempDirectory(tempDir_);
}

AppController::Options TestEndToEndIntegration::options() const {
    AppController::Options options;
    options.configPath = configPath_;
    options.locator = locator_;
    options.storeFactory = InMemoryObjectStore::factory(store_);
    return options;
}

AppConfig TestEndToEndIntegration::toolchainConfig() const {
    AppConfig config;
    config.minio.url = "http://minio.local:9000";
    config.minio.accessKey = "minio";
    config.minio.secretKey = "minio-secret";
    config.minio.bucket = "meetings";
    config.whisper.binaryPath = toolchain_.whisperPath;
    config.whisper.ffmpegPath = toolchain_.ffmpegPath;
    config.whisper.modelPath = toolchain_.modelPath;
    config.whisper.outputDir = outputDir_;
    return config;
}

JobSnapshot TestEndToEndIntegration::waitForTerminal(AppController& controller, const QString& jobId) const {
    JobSnapshot last;
    TestUtils::waitForCondition([&]() {
        auto status = controller.transcribeStatus(jobId);
        if (status.hasError()) {
            return false;
        }
        last = status.value();
        return last.isTerminal();
    }, 15000);
    return last;
}

void TestEndToEndIntegration::testBrowseAndTranscribeMeeting() {
#if defined(Q_OS_WIN)
    QSKIP("Fake toolchain needs /bin/sh");
#endif
    QVERIFY(toolchain_.install(QDir(tempDir_).filePath("bin")));
    store_->putObject("2024-05-01/A/09:00/track.wav");

    AppController controller(options());
    QSignalSpy configSpy(&controller, &AppController::configChanged);
    QSignalSpy jobSpy(&controller, &AppController::jobStarted);
    controller.setConfig(toolchainConfig());
    QCOMPARE(configSpy.count(), 1);

    auto dates = controller.listDates();
    QVERIFY2(dates.hasValue(), qPrintable(TestUtils::errorText(dates)));
    QCOMPARE(dates.value(), QStringList({"2024-05-01"}));

    auto meetings = controller.listMeetings("2024-05-01");
    QVERIFY2(meetings.hasValue(), qPrintable(TestUtils::errorText(meetings)));
    QCOMPARE(meetings.value().size(), 1);
    const MeetingSummary meeting = meetings.value().first();
    QCOMPARE(meeting.id, QString("2024-05-01/A/09:00"));
    QCOMPARE(meeting.roomId, QString("A"));
    QCOMPARE(meeting.meetingTime, QString("09:00"));
    QCOMPARE(meeting.trackCount, 1);

    auto jobId = controller.startTranscribe(meeting.id);
    QVERIFY2(jobId.hasValue(), qPrintable(TestUtils::errorText(jobId)));
    QCOMPARE(jobSpy.count(), 1);
    QCOMPARE(jobSpy.first().at(0).toString(), jobId.value());

    const JobSnapshot snapshot = waitForTerminal(controller, jobId.value());
    QCOMPARE(snapshot.state, JobState::Completed);
    QVERIFY(snapshot.error.isEmpty());
    QCOMPARE(snapshot.outputPath, QDir(outputDir_).filePath("2024-05-01_A_09:00.txt"));
    QCOMPARE(snapshot.completed, snapshot.total);
    QCOMPARE(TestUtils::readTextFile(snapshot.outputPath),
             QString("Good morning everyone.\nLet's start the review.\n"));
    QCOMPARE(store_->downloadCalls(), 1);
    QVERIFY(!controller.activeJobId().has_value());

    const QJsonObject json = snapshot.toJson();
    QCOMPARE(json.value("state").toString(), QString("completed"));
    QVERIFY(json.value("error").isNull());
}

void TestEndToEndIntegration::testSecondTranscriptionRejectedWhileRunning() {
    auto gate = std::make_shared<QSemaphore>();
    AppController::Options opts = options();
    opts.pipelineRunner = [gate](const QString&, const AppConfig&, PipelineObserver& observer)
        -> Expected<QString, StageFailure> {
        observer.onStageStarted(PipelineStage::Fetch);
        gate->acquire();
        return QStringLiteral("/out/held.txt");
    };

    AppController controller(std::move(opts));
    auto releaseGate = qScopeGuard([gate]() { gate->release(10); });

    auto first = controller.startTranscribe("2024-05-01/A/09:00");
    QVERIFY(first.hasValue());
    auto second = controller.startTranscribe("2024-05-01/B/10:00");
    QVERIFY(second.hasError());
    QCOMPARE(second.error().code, ErrorCode::ConflictError);
    QVERIFY(second.error().message.startsWith(QString("Job %1 is already").arg(first.value())));

    auto invalid = controller.startTranscribe("not-a-meeting");
    QVERIFY(invalid.hasError());
    QCOMPARE(invalid.error().code, ErrorCode::InvalidArgument);

    gate->release();
    QVERIFY(controller.waitForJobs(5000));
    QCOMPARE(controller.transcribeStatus(first.value()).value().state, JobState::Completed);

    auto unknown = controller.transcribeStatus("missing");
    QVERIFY(unknown.hasError());
    QCOMPARE(unknown.error().code, ErrorCode::NotFound);
}

void TestEndToEndIntegration::testFailedTranscriptionReportsStage() {
#if defined(Q_OS_WIN)
    QSKIP("Fake toolchain needs /bin/sh");
#endif
    toolchain_.whisperExitCode = 3;
    QVERIFY(toolchain_.install(QDir(tempDir_).filePath("bin")));
    store_->putObject("2024-05-01/A/09:00/track.wav");

    AppController controller(options());
    controller.setConfig(toolchainConfig());

    auto jobId = controller.startTranscribe("2024-05-01/A/09:00");
    QVERIFY(jobId.hasValue());

    const JobSnapshot snapshot = waitForTerminal(controller, jobId.value());
    QCOMPARE(snapshot.state, JobState::Failed);
    QCOMPARE(snapshot.errorCode, std::optional<ErrorCode>(ErrorCode::RecognitionError));
    QVERIFY(snapshot.error.startsWith("Recognize failed:"));
    QVERIFY(snapshot.outputPath.isEmpty());
    QVERIFY(!QFile::exists(QDir(outputDir_).filePath("2024-05-01_A_09:00.txt")));
}

void TestEndToEndIntegration::testConfigurationPersistsAcrossRestarts() {
    AppConfig config = toolchainConfig();
    config.whisper.language = "en";
    config.whisper.includeTimestamps = true;

    {
        AppController controller(options());
        QCOMPARE(controller.configPath(), configPath_);
        controller.setConfig(config);
        QCOMPARE(controller.config().whisper.language, QString("en"));
        auto flushed = controller.flushConfig();
        QVERIFY2(flushed.hasValue(), qPrintable(TestUtils::errorText(flushed)));
    }

    QVERIFY(QFile::exists(configPath_));
    const QJsonObject onDisk = QJsonDocument::fromJson(TestUtils::readTextFile(configPath_).toUtf8()).object();
    QVERIFY(onDisk.contains("minio"));
    QVERIFY(onDisk.contains("whisper"));

    AppController restarted(options());
    QVERIFY(restarted.config() == config);
}

void TestEndToEndIntegration::testFailedConfigWriteIsReported() {
    AppController::Options opts = options();
    opts.configWriter = std::make_unique<RecordingConfigWriter>(false, true);

    AppController controller(std::move(opts));
    AppConfig config = controller.config();
    config.whisper.language = "de";
    controller.setConfig(config);

    // The in-memory value is updated even though the disk write failed
    QCOMPARE(controller.config().whisper.language, QString("de"));
    auto flushed = controller.flushConfig();
    QVERIFY(flushed.hasError());
    QCOMPARE(flushed.error().code, ErrorCode::ConfigPersistError);
}

void TestEndToEndIntegration::testUnreachableObjectStore() {
    AppController::Options opts = options();
    opts.storeFactory = nullptr;
    opts.connectivityRetry.policy = RetryPolicy::Linear;
    opts.connectivityRetry.maxAttempts = 2;
    opts.connectivityRetry.initialDelay = std::chrono::milliseconds(1);
    opts.connectivityRetry.enableJitter = false;

    AppController controller(std::move(opts));

    const Health incomplete = controller.checkMinio();
    QVERIFY(!incomplete.reachable);
    QCOMPARE(incomplete.tag, HealthTag::IncompleteConfig);

    AppConfig config = toolchainConfig();
    config.minio.url = "http://127.0.0.1:1";
    controller.setConfig(config);

    const Health health = controller.checkMinio();
    QVERIFY(!health.reachable);
    QVERIFY(health.tag == HealthTag::NetworkError || health.tag == HealthTag::Timeout);
    QVERIFY(!health.reason.isEmpty());

    auto dates = controller.listDates();
    QVERIFY(dates.hasError());
    QCOMPARE(dates.error().code, ErrorCode::CatalogError);
}

void TestEndToEndIntegration::testDefaultsComeFromLocator() {
    locator_->whisper = QStringLiteral("/opt/whisper/bin/whisper-cli");
    locator_->ffmpeg = QStringLiteral("/usr/bin/ffmpeg");
    locator_->models = QDir(tempDir_).filePath("models");
    locator_->output = QDir(tempDir_).filePath("Documents");

    AppController controller(options());
    QCOMPARE(controller.defaultWhisperBinary(), locator_->whisper);
    QCOMPARE(controller.defaultFfmpegBinary(), locator_->ffmpeg);
    QCOMPARE(controller.defaultWhisperModelRoot(), locator_->models);
    QCOMPARE(controller.defaultOutputDir(), locator_->output);

    // A fresh configuration is completed from the locator
    const AppConfig config = controller.config();
    QCOMPARE(config.whisper.binaryPath, *locator_->whisper);
    QCOMPARE(config.whisper.outputDir, *locator_->output);
    QCOMPARE(config.whisper.modelPath, QDir(*locator_->models).filePath("ggml-large-v3.bin"));
}

int runTestEndToEndIntegration(int argc, char** argv) {
    TestEndToEndIntegration test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_end_to_end_integration.moc"
