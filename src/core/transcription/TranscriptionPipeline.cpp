#include "TranscriptionPipeline.hpp"
#include "../catalog/MeetingCatalog.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QTemporaryDir>
#include <algorithm>
#include <cmath>

namespace Scribe {

namespace {

Unexpected<StageFailure> stageFailure(PipelineStage stage, const QString& message) {
    return makeUnexpected(StageFailure{stage, message});
}

QString trackFileBase(const QString& scratchDir, int index) {
    return QDir(scratchDir).filePath(QStringLiteral("track_%1").arg(index, 3, 10, QChar('0')));
}

} // namespace

TranscriptionPipeline::TranscriptionPipeline(ObjectStore& store,
                                             AppConfig config,
                                             std::shared_ptr<DefaultsLocator> locator,
                                             RetryConfig fetchRetry)
    : store_(store)
    , config_(std::move(config))
    , locator_(locator ? std::move(locator) : std::make_shared<SystemDefaultsLocator>())
    , fetchRetry_(fetchRetry)
    , scratchRoot_(QDir::tempPath()) {
}

void TranscriptionPipeline::setExtractor(std::unique_ptr<AudioExtractor> extractor) {
    extractor_ = std::move(extractor);
}

void TranscriptionPipeline::setRecognizer(std::unique_ptr<SpeechRecognizer> recognizer) {
    recognizer_ = std::move(recognizer);
}

void TranscriptionPipeline::setScratchRoot(const QString& path) {
    scratchRoot_ = path;
}

Expected<QString, StageFailure> TranscriptionPipeline::run(const QString& meetingId,
                                                           PipelineObserver& observer) {
    SCRIBE_INFO("Transcription of {} started", meetingId.toStdString());
    reportedProgress_ = 0;

    auto prepared = prepare(observer);
    if (prepared.hasError()) {
        return makeUnexpected(prepared.error());
    }

    QDir().mkpath(scratchRoot_);
    QTemporaryDir scratch(QDir(scratchRoot_).filePath(QStringLiteral("scribe-job-XXXXXX")));
    if (!scratch.isValid()) {
        return stageFailure(PipelineStage::Fetch,
                            QStringLiteral("cannot create scratch directory: %1").arg(scratch.errorString()));
    }
    const QString scratchDir = scratch.path();

    QList<LocalTrack> tracks;
    auto fetched = fetch(meetingId, scratchDir, tracks, observer);
    if (fetched.hasError()) {
        return makeUnexpected(fetched.error());
    }

    auto extracted = extract(scratchDir, tracks, observer);
    if (extracted.hasError()) {
        return makeUnexpected(extracted.error());
    }

    auto recognized = recognize(scratchDir, tracks, observer);
    if (recognized.hasError()) {
        return makeUnexpected(recognized.error());
    }

    return format(meetingId, tracks, observer);
}

Expected<void, StageFailure> TranscriptionPipeline::prepare(PipelineObserver& observer) {
    observer.onStageStarted(PipelineStage::Prepare);
    const WhisperSettings& settings = config_.whisper;

    if (!recognizer_) {
        const QString whisperBinary = resolveWhisperBinary(settings, *locator_);
        if (whisperBinary.isEmpty() || !QFileInfo(whisperBinary).isFile()) {
            return stageFailure(PipelineStage::Recognize,
                                whisperBinary.isEmpty()
                                    ? QStringLiteral("whisper binary not found")
                                    : QStringLiteral("whisper binary not found at %1").arg(whisperBinary));
        }

        modelPath_ = resolveModelPath(settings, *locator_);
        if (modelPath_.isEmpty() || !QFileInfo(modelPath_).isFile()) {
            return stageFailure(PipelineStage::Recognize,
                                modelPath_.isEmpty()
                                    ? QStringLiteral("whisper model not found")
                                    : QStringLiteral("whisper model not found at %1").arg(modelPath_));
        }

        recognizer_ = std::make_unique<WhisperCliRecognizer>(whisperBinary);
        observer.onLogLine(QStringLiteral("Using whisper %1 with model %2").arg(whisperBinary, modelPath_));
    } else {
        modelPath_ = resolveModelPath(settings, *locator_);
    }

    if (!extractor_) {
        const QString ffmpegBinary = resolveFfmpegBinary(settings, *locator_);
        if (ffmpegBinary.isEmpty() || !QFileInfo(ffmpegBinary).isFile()) {
            return stageFailure(PipelineStage::Extract,
                                ffmpegBinary.isEmpty()
                                    ? QStringLiteral("ffmpeg binary not found")
                                    : QStringLiteral("ffmpeg binary not found at %1").arg(ffmpegBinary));
        }

        extractor_ = std::make_unique<FfmpegExtractor>(ffmpegBinary);
        observer.onLogLine(QStringLiteral("Using ffmpeg %1").arg(ffmpegBinary));
    }

    outputDir_ = settings.outputDir.trimmed();
    if (outputDir_.isEmpty()) {
        outputDir_ = locator_->outputDir().value_or(QString());
    }

    return {};
}

Expected<void, StageFailure> TranscriptionPipeline::fetch(const QString& meetingId,
                                                          const QString& scratchDir,
                                                          QList<LocalTrack>& tracks,
                                                          PipelineObserver& observer) {
    observer.onStageStarted(PipelineStage::Fetch);

    MeetingCatalog catalog(store_);
    auto entries = catalog.resolveTracks(meetingId);
    if (entries.hasError()) {
        return stageFailure(PipelineStage::Fetch, entries.error().message);
    }
    if (entries.value().isEmpty()) {
        return stageFailure(PipelineStage::Fetch,
                            QStringLiteral("no audio objects found for %1").arg(meetingId));
    }

    observer.onTotalKnown(static_cast<int>(entries.value().size()) * PROGRESS_UNITS_PER_TRACK);
    observer.onLogLine(QStringLiteral("Fetching %1 track(s)").arg(entries.value().size()));

    RetryManager retry(fetchRetry_);
    int index = 0;
    for (const TrackEntry& entry : entries.value()) {
        const QString suffix = QFileInfo(entry.key).suffix();
        const QString destination = trackFileBase(scratchDir, index++)
                                    + (suffix.isEmpty() ? QString() : QStringLiteral(".") + suffix);

        observer.onLogLine(QStringLiteral("Downloading %1").arg(entry.key));
        auto downloaded = retry.execute<qint64, StoreFailure>(
            [&]() { return store_.download(entry.key, destination); },
            [](const StoreFailure& failure) { return isTransientStoreError(failure.kind); });

        if (downloaded.hasError()) {
            const auto& failure = downloaded.error();
            SCRIBE_ERROR("Download of {} failed after {} attempt(s): {}", entry.key.toStdString(),
                         failure.attempts, describeFailure(failure.lastError).toStdString());
            return stageFailure(PipelineStage::Fetch,
                                QStringLiteral("%1: %2").arg(entry.key, describeFailure(failure.lastError)));
        }

        observer.onLogLine(QStringLiteral("Downloaded %1 (%2 bytes)").arg(entry.key).arg(downloaded.value()));

        LocalTrack track;
        track.entry = entry;
        track.downloadedPath = destination;
        tracks.append(track);
    }

    return {};
}

Expected<void, StageFailure> TranscriptionPipeline::extract(const QString& scratchDir,
                                                            QList<LocalTrack>& tracks,
                                                            PipelineObserver& observer) {
    observer.onStageStarted(PipelineStage::Extract);

    for (int i = 0; i < tracks.size(); ++i) {
        LocalTrack& track = tracks[i];
        const QString wavPath = trackFileBase(scratchDir, i) + QStringLiteral(".wav");

        auto audio = extractor_->extract(track.downloadedPath, wavPath,
                                         [&observer](const QString& line) { observer.onLogLine(line); });
        if (audio.hasError()) {
            return stageFailure(PipelineStage::Extract,
                                QStringLiteral("%1: %2").arg(track.entry.key, audio.error()));
        }
        track.audio = audio.value();
    }

    return {};
}

Expected<void, StageFailure> TranscriptionPipeline::recognize(const QString& scratchDir,
                                                              QList<LocalTrack>& tracks,
                                                              PipelineObserver& observer) {
    observer.onStageStarted(PipelineStage::Recognize);

    for (int i = 0; i < tracks.size(); ++i) {
        LocalTrack& track = tracks[i];
        const int base = i * PROGRESS_UNITS_PER_TRACK;

        RecognitionRequest request;
        request.audioPath = track.audio.wavPath;
        request.outputBase = trackFileBase(scratchDir, i);
        request.modelPath = modelPath_;
        request.language = config_.whisper.language;
        request.audioDurationMs = track.audio.durationMs;

        auto segments = recognizer_->recognize(request, [&](const ProgressDelta& delta) {
            if (!delta.logLine.isEmpty()) {
                observer.onLogLine(delta.logLine);
            }
            if (delta.fraction) {
                // A track only counts as fully done once its output is read
                const int units = std::min(PROGRESS_UNITS_PER_TRACK - 1,
                                           static_cast<int>(std::floor(*delta.fraction * PROGRESS_UNITS_PER_TRACK)));
                reportProgress(base + units, observer);
            }
        });

        if (segments.hasError()) {
            return stageFailure(PipelineStage::Recognize,
                                QStringLiteral("%1: %2").arg(track.entry.key, segments.error()));
        }

        track.segments = segments.value();
        reportProgress(base + PROGRESS_UNITS_PER_TRACK, observer);
    }

    return {};
}

Expected<QString, StageFailure> TranscriptionPipeline::format(const QString& meetingId,
                                                              const QList<LocalTrack>& tracks,
                                                              PipelineObserver& observer) {
    observer.onStageStarted(PipelineStage::Format);

    QList<TrackTranscript> transcripts;
    for (const LocalTrack& track : tracks) {
        transcripts.append(TrackTranscript{track.entry, track.segments});
    }

    FormatOptions options;
    options.includeTimestamps = config_.whisper.includeTimestamps;
    options.includeSpeaker = config_.whisper.includeSpeaker;

    const QList<TranscriptSegment> merged = TranscriptionFormatter::mergeTracks(transcripts);
    const QString text = TranscriptionFormatter::convertToPlainText(merged, options);

    auto written = TranscriptionFormatter::writeTranscript(outputDir_, meetingId, text);
    if (written.hasError()) {
        return stageFailure(PipelineStage::Format, written.error());
    }

    observer.onLogLine(QStringLiteral("Transcript saved to %1").arg(written.value()));
    SCRIBE_INFO("Transcription of {} completed: {} segment(s)", meetingId.toStdString(), merged.size());
    return written.value();
}

void TranscriptionPipeline::reportProgress(int completed, PipelineObserver& observer) {
    if (completed > reportedProgress_) {
        reportedProgress_ = completed;
        observer.onProgress(completed);
    }
}

} // namespace Scribe
