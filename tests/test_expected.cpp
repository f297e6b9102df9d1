#include <QtTest/QtTest>
#include "../src/core/common/Expected.hpp"
#include "../src/core/common/OrchestratorError.hpp"

using namespace Scribe;

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueConstruction() {
        Expected<int, QString> result(42);

        QVERIFY(result.hasValue());
        QVERIFY(!result.hasError());
        QVERIFY(static_cast<bool>(result));
        QCOMPARE(result.value(), 42);
    }

    void testErrorConstruction() {
        Expected<int, QString> result = makeUnexpected(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), QString("Error occurred"));
    }

    void testSameValueAndErrorType() {
        Expected<QString, QString> value(QString("path/to/file"));
        Expected<QString, QString> error = makeUnexpected(QString("no such file"));

        QVERIFY(value.hasValue());
        QCOMPARE(value.value(), QString("path/to/file"));
        QVERIFY(error.hasError());
        QCOMPARE(error.error(), QString("no such file"));
    }

    void testAccessingWrongSideThrows() {
        Expected<int, QString> success(1);
        Expected<int, QString> failure = makeUnexpected(QString("Failed"));

        bool errorThrew = false;
        try {
            (void)success.error();
        } catch (const std::runtime_error&) {
            errorThrew = true;
        }
        QVERIFY(errorThrew);

        bool valueThrew = false;
        try {
            (void)failure.value();
        } catch (const std::runtime_error&) {
            valueThrew = true;
        }
        QVERIFY(valueThrew);
    }

    void testMonadicOperations() {
        Expected<int, QString> success(10);

        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure = makeUnexpected(QString("Failed"));
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure = makeUnexpected(QString("Error"));
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testCopySemantics() {
        Expected<int, QString> original(123);
        Expected<int, QString> copy = original;

        QVERIFY(copy.hasValue());
        QCOMPARE(copy.value(), 123);

        // Original should still be valid
        QVERIFY(original.hasValue());
        QCOMPARE(original.value(), 123);
    }

    void testVoidSpecialization() {
        Expected<void, OrchestratorError> ok;
        QVERIFY(ok.hasValue());

        Expected<void, OrchestratorError> failed =
            makeUnexpected(OrchestratorError(ErrorCode::ConfigPersistError, "disk full"));
        QVERIFY(failed.hasError());
        QCOMPARE(failed.error().code, ErrorCode::ConfigPersistError);
        QCOMPARE(failed.error().toString(), QString("ConfigPersistError: disk full"));

        ok = failed;
        QVERIFY(ok.hasError());
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"
