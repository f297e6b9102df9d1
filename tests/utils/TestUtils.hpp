#pragma once

#include <QtTest/QtTest>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <functional>

#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/Logger.hpp"
#include "../../src/core/common/OrchestratorError.hpp"
#include "../../src/core/storage/ObjectStore.hpp"
#include "../../src/core/transcription/TranscriptionTypes.hpp"

namespace Scribe {
namespace Test {

/**
 * @brief Test utilities for the Scribe test suites
 *
 * Owns one temporary directory per test run; everything a suite creates
 * lives below it.
 */
class TestUtils {
public:
    // Test environment setup
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    // Temporary directory management
    static QString createTempDirectory(const QString& prefix = "scribe_test");
    static void cleanupTempDirectory(const QString& path);

    // Test file creation
    static QString createTestTextFile(const QString& directory, const QString& content,
                                      const QString& filename = "test.txt");
    static QString createExecutableScript(const QString& directory, const QString& filename,
                                          const QString& body);
    static QString readTextFile(const QString& filePath);

    // Async testing utilities
    static bool waitForCondition(std::function<bool()> condition, int timeoutMs = 5000,
                                 int checkIntervalMs = 20);

    static void logMessage(const QString& message);

    // Readable error text for QVERIFY2 messages
    static QString describe(const OrchestratorError& error) { return error.toString(); }
    static QString describe(const StageFailure& failure) { return failure.describe(); }
    static QString describe(const StoreFailure& failure) { return describeFailure(failure); }
    static QString describe(const QString& error) { return error; }

    template<typename T, typename E>
    static QString errorText(const Expected<T, E>& result) {
        return result.hasError() ? describe(result.error()) : QStringLiteral("<value>");
    }

private:
    static QTemporaryDir* tempDir_;
};

} // namespace Test
} // namespace Scribe
