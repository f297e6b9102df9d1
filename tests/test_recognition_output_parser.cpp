#include <QtTest/QtTest>
#include "utils/TestUtils.hpp"
#include "../src/core/transcription/RecognitionOutputParser.hpp"

using namespace Scribe;

class TestRecognitionOutputParser : public QObject {
    Q_OBJECT

private slots:
    void testSegmentEndLongForm();
    void testSegmentEndShortForm();
    void testPercentage_data();
    void testPercentage();

    void testSegmentLinesScaleByDuration();
    void testUnknownDurationIgnoresSegments();
    void testFractionNeverDecreases();
    void testFractionIsClamped();
    void testBlankLinesProduceNothing();
    void testPlainLogLinePassesThrough();
};

void TestRecognitionOutputParser::testSegmentEndLongForm() {
    QCOMPARE(RecognitionOutputParser::segmentEndMs("[00:00:01.000 --> 00:01:04.500]   hello"),
             std::optional<qint64>(64500));
    QCOMPARE(RecognitionOutputParser::segmentEndMs("[01:00:00,000 --> 01:00:02,250] x"),
             std::optional<qint64>(3602250));
}

void TestRecognitionOutputParser::testSegmentEndShortForm() {
    QCOMPARE(RecognitionOutputParser::segmentEndMs("[00:01.000 --> 02:03.040] short"),
             std::optional<qint64>(123040));
    QVERIFY(!RecognitionOutputParser::segmentEndMs("00:01.000 --> 02:03.040").has_value());
    QVERIFY(!RecognitionOutputParser::segmentEndMs("no timing here").has_value());
}

void TestRecognitionOutputParser::testPercentage_data() {
    QTest::addColumn<QString>("line");
    QTest::addColumn<double>("expected");
    QTest::addColumn<bool>("matches");

    QTest::newRow("callback") << "whisper_print_progress_callback: progress =  40%" << 40.0 << true;
    QTest::newRow("colon") << "Progress: 12.5 %" << 12.5 << true;
    QTest::newRow("complete") << "progress = 100%" << 100.0 << true;
    QTest::newRow("over range") << "progress = 140%" << 0.0 << false;
    QTest::newRow("no percent sign") << "progress = 40" << 0.0 << false;
    QTest::newRow("unrelated") << "whisper_init_from_file: loading model" << 0.0 << false;
}

void TestRecognitionOutputParser::testPercentage() {
    QFETCH(QString, line);
    QFETCH(double, expected);
    QFETCH(bool, matches);

    const auto value = RecognitionOutputParser::percentage(line);
    QCOMPARE(value.has_value(), matches);
    if (matches) {
        QCOMPARE(*value, expected);
    }
}

void TestRecognitionOutputParser::testSegmentLinesScaleByDuration() {
    RecognitionOutputParser parser(10000);

    const ProgressDelta first = parser.parseLine("[00:00:00.000 --> 00:00:02.500]  Good morning.");
    QVERIFY(first.fraction.has_value());
    QCOMPARE(*first.fraction, 0.25);
    QCOMPARE(first.logLine, QString("[00:00:00.000 --> 00:00:02.500]  Good morning."));

    const ProgressDelta second = parser.parseLine("[00:00:02.500 --> 00:00:05.000]  Let's begin.");
    QCOMPARE(*second.fraction, 0.5);
    QCOMPARE(parser.currentFraction(), 0.5);
}

void TestRecognitionOutputParser::testUnknownDurationIgnoresSegments() {
    RecognitionOutputParser parser;

    const ProgressDelta segment = parser.parseLine("[00:00:00.000 --> 00:00:02.500]  text");
    QVERIFY(!segment.fraction.has_value());
    QVERIFY(!segment.logLine.isEmpty());

    const ProgressDelta percent = parser.parseLine("progress = 30%");
    QVERIFY(percent.fraction.has_value());
    QCOMPARE(*percent.fraction, 0.3);

    parser.setAudioDuration(5000);
    QCOMPARE(parser.audioDuration(), qint64(5000));
    QCOMPARE(*parser.parseLine("[00:00:02.500 --> 00:00:04.000] more").fraction, 0.8);
}

void TestRecognitionOutputParser::testFractionNeverDecreases() {
    RecognitionOutputParser parser(10000);

    QCOMPARE(*parser.parseLine("progress = 60%").fraction, 0.6);
    // A segment line behind the reported percentage does not move progress back
    QVERIFY(!parser.parseLine("[00:00:01.000 --> 00:00:02.000] late").fraction.has_value());
    QVERIFY(!parser.parseLine("progress = 60%").fraction.has_value());
    QCOMPARE(parser.currentFraction(), 0.6);
    QCOMPARE(*parser.parseLine("progress = 61%").fraction, 0.61);
}

void TestRecognitionOutputParser::testFractionIsClamped() {
    RecognitionOutputParser parser(1000);

    const ProgressDelta delta = parser.parseLine("[00:00:00.000 --> 00:00:03.000] beyond the end");
    QVERIFY(delta.fraction.has_value());
    QCOMPARE(*delta.fraction, 1.0);
}

void TestRecognitionOutputParser::testBlankLinesProduceNothing() {
    RecognitionOutputParser parser(1000);

    const ProgressDelta delta = parser.parseLine("   \t ");
    QVERIFY(delta.logLine.isEmpty());
    QVERIFY(!delta.fraction.has_value());
}

void TestRecognitionOutputParser::testPlainLogLinePassesThrough() {
    RecognitionOutputParser parser(1000);

    const ProgressDelta delta = parser.parseLine("  whisper_model_load: n_vocab = 51865\n");
    QCOMPARE(delta.logLine, QString("whisper_model_load: n_vocab = 51865"));
    QVERIFY(!delta.fraction.has_value());
}

int runTestRecognitionOutputParser(int argc, char** argv) {
    TestRecognitionOutputParser test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_recognition_output_parser.moc"
