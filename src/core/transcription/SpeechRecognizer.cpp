#include "SpeechRecognizer.hpp"
#include "WhisperOutputReader.hpp"
#include "../common/Logger.hpp"
#include "../process/ProcessRunner.hpp"
#include <QtCore/QFile>

namespace Scribe {

WhisperCliRecognizer::WhisperCliRecognizer(QString binaryPath)
    : binaryPath_(std::move(binaryPath)) {
}

QStringList WhisperCliRecognizer::arguments(const RecognitionRequest& request) {
    QStringList args;
    args << "-m" << request.modelPath;
    args << "-f" << request.audioPath;
    args << "-l" << (request.language.isEmpty() ? QStringLiteral("ja") : request.language);

    // JSON for segments, plain text as fallback
    args << "-oj" << "-otxt";
    args << "-of" << request.outputBase;

    args << "--print-progress";
    return args;
}

Expected<QList<TranscriptSegment>, QString> WhisperCliRecognizer::recognize(
    const RecognitionRequest& request,
    const ProgressSink& onProgress) {

    // Stale output from an earlier run must not be mistaken for this one
    QFile::remove(request.outputBase + ".json");
    QFile::remove(request.outputBase + ".txt");

    ProcessCommand command;
    command.program = binaryPath_;
    command.arguments = arguments(request);

    RecognitionOutputParser parser(request.audioDurationMs);
    const ProcessResult result = ProcessRunner::run(command, [&](const QString& line, OutputChannel) {
        const ProgressDelta delta = parser.parseLine(line);
        if (onProgress && (delta.fraction || !delta.logLine.isEmpty())) {
            onProgress(delta);
        }
    });

    if (!result.succeeded()) {
        SCRIBE_ERROR("whisper {} for {}", result.describeFailure().toStdString(),
                     request.audioPath.toStdString());
        return makeUnexpected(QStringLiteral("whisper %1").arg(result.describeFailure()));
    }

    auto segments = WhisperOutputReader::read(request.outputBase);
    if (segments.hasError()) {
        SCRIBE_ERROR("{}", segments.error().toStdString());
        return makeUnexpected(segments.error());
    }

    SCRIBE_INFO("Recognized {} segment(s) from {}", segments.value().size(),
                request.audioPath.toStdString());
    return segments;
}

} // namespace Scribe
