#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestRetryManager(int argc, char** argv);
extern int runTestConfigStore(int argc, char** argv);
extern int runTestPlatformDefaults(int argc, char** argv);
extern int runTestS3Client(int argc, char** argv);
extern int runTestConnectivityChecker(int argc, char** argv);
extern int runTestMeetingCatalog(int argc, char** argv);
extern int runTestRecognitionOutputParser(int argc, char** argv);
extern int runTestWhisperOutputReader(int argc, char** argv);
extern int runTestTranscriptionFormatter(int argc, char** argv);
extern int runTestTranscriptionPipeline(int argc, char** argv);
extern int runTestJobManager(int argc, char** argv);
extern int runTestEndToEndIntegration(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("ScribeDesktopTests");
    app.setOrganizationName("Scribe");

    Scribe::Logger::instance().initialize("scribe-tests.log", Scribe::Logger::Level::Debug);
    Scribe::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"RetryManager", runTestRetryManager},
        {"ConfigStore", runTestConfigStore},
        {"PlatformDefaults", runTestPlatformDefaults},
        {"S3Client", runTestS3Client},
        {"ConnectivityChecker", runTestConnectivityChecker},
        {"MeetingCatalog", runTestMeetingCatalog},
        {"RecognitionOutputParser", runTestRecognitionOutputParser},
        {"WhisperOutputReader", runTestWhisperOutputReader},
        {"TranscriptionFormatter", runTestTranscriptionFormatter},
        {"TranscriptionPipeline", runTestTranscriptionPipeline},
        {"JobManager", runTestJobManager},
        {"EndToEndIntegration", runTestEndToEndIntegration}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    Scribe::Test::TestUtils::cleanupTestEnvironment();

    // Summary
    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
