#include "AudioExtractor.hpp"
#include "../common/Logger.hpp"
#include "../process/ProcessRunner.hpp"
#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>

namespace Scribe {

FfmpegExtractor::FfmpegExtractor(QString ffmpegPath)
    : ffmpegPath_(std::move(ffmpegPath)) {
}

QStringList FfmpegExtractor::arguments(const QString& inputPath, const QString& outputWavPath) {
    QStringList args;
    args << "-y" << "-nostdin";
    args << "-i" << inputPath;

    // Whisper input: 16kHz, mono, WAV
    args << "-ar" << QString::number(SAMPLE_RATE);
    args << "-ac" << QString::number(CHANNELS);
    args << "-c:a" << "pcm_s16le";

    args << outputWavPath;
    return args;
}

std::optional<qint64> FfmpegExtractor::parseDuration(const QString& line) {
    static const QRegularExpression durationRegex(
        R"(Duration:\s*(\d+):(\d{2}):(\d{2})(?:\.(\d+))?)");

    const QRegularExpressionMatch match = durationRegex.match(line);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const qint64 hours = match.captured(1).toLongLong();
    const qint64 minutes = match.captured(2).toLongLong();
    const qint64 seconds = match.captured(3).toLongLong();
    // Fraction digits are scaled to milliseconds: ".5" and ".50" are both 500.
    const qint64 millis = match.captured(4).leftJustified(3, '0', true).toLongLong();

    return ((hours * 60 + minutes) * 60 + seconds) * 1000 + millis;
}

Expected<ExtractedAudio, QString> FfmpegExtractor::extract(const QString& inputPath,
                                                           const QString& outputWavPath,
                                                           const LogSink& onLog) {
    if (!QFileInfo::exists(inputPath)) {
        return makeUnexpected(QStringLiteral("input file not found: %1").arg(inputPath));
    }

    ProcessCommand command;
    command.program = ffmpegPath_;
    command.arguments = arguments(inputPath, outputWavPath);

    ExtractedAudio audio;
    audio.wavPath = outputWavPath;

    const ProcessResult result = ProcessRunner::run(command, [&](const QString& line, OutputChannel) {
        if (audio.durationMs == 0) {
            if (auto duration = parseDuration(line)) {
                audio.durationMs = *duration;
            }
        }
        if (onLog) {
            onLog(line);
        }
    });

    if (!result.succeeded()) {
        SCRIBE_ERROR("ffmpeg {} for {}", result.describeFailure().toStdString(), inputPath.toStdString());
        return makeUnexpected(QStringLiteral("ffmpeg %1").arg(result.describeFailure()));
    }

    const QFileInfo output(outputWavPath);
    if (!output.exists() || output.size() == 0) {
        SCRIBE_ERROR("ffmpeg produced no output at {}", outputWavPath.toStdString());
        return makeUnexpected(QStringLiteral("ffmpeg produced no output at %1").arg(outputWavPath));
    }

    SCRIBE_DEBUG("Extracted {} ({} ms of audio)", outputWavPath.toStdString(),
                 static_cast<long long>(audio.durationMs));
    return audio;
}

} // namespace Scribe
