#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <memory>
#include "AudioExtractor.hpp"
#include "SpeechRecognizer.hpp"
#include "TranscriptionFormatter.hpp"
#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"
#include "../common/RetryManager.hpp"
#include "../config/AppConfig.hpp"
#include "../config/PlatformDefaults.hpp"
#include "../storage/ObjectStore.hpp"

namespace Scribe {

/**
 * @brief Prepare -> Fetch -> Extract -> Recognize -> Format for one meeting
 *
 * Runs entirely on the calling thread and blocks for as long as the external
 * tools run. Every stage is gated on the previous one; the first failure ends
 * the run. Downloaded and extracted files live in a per-run scratch directory
 * that is removed when run() returns.
 */
class TranscriptionPipeline {
public:
    TranscriptionPipeline(ObjectStore& store,
                          AppConfig config,
                          std::shared_ptr<DefaultsLocator> locator,
                          RetryConfig fetchRetry = RetryConfigs::network());

    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;

    // Injected tools replace the configured binaries and skip their checks in Prepare.
    void setExtractor(std::unique_ptr<AudioExtractor> extractor);
    void setRecognizer(std::unique_ptr<SpeechRecognizer> recognizer);

    // Parent of the scratch directory, the system temp dir by default.
    void setScratchRoot(const QString& path);

    // Path of the written transcript.
    Expected<QString, StageFailure> run(const QString& meetingId, PipelineObserver& observer);

private:
    struct LocalTrack {
        TrackEntry entry;
        QString downloadedPath;
        ExtractedAudio audio;
        QList<TranscriptSegment> segments;
    };

    Expected<void, StageFailure> prepare(PipelineObserver& observer);
    Expected<void, StageFailure> fetch(const QString& meetingId,
                                       const QString& scratchDir,
                                       QList<LocalTrack>& tracks,
                                       PipelineObserver& observer);
    Expected<void, StageFailure> extract(const QString& scratchDir,
                                         QList<LocalTrack>& tracks,
                                         PipelineObserver& observer);
    Expected<void, StageFailure> recognize(const QString& scratchDir,
                                           QList<LocalTrack>& tracks,
                                           PipelineObserver& observer);
    Expected<QString, StageFailure> format(const QString& meetingId,
                                           const QList<LocalTrack>& tracks,
                                           PipelineObserver& observer);

    void reportProgress(int completed, PipelineObserver& observer);

    ObjectStore& store_;
    AppConfig config_;
    std::shared_ptr<DefaultsLocator> locator_;
    RetryConfig fetchRetry_;
    QString scratchRoot_;

    std::unique_ptr<AudioExtractor> extractor_;
    std::unique_ptr<SpeechRecognizer> recognizer_;
    QString modelPath_;
    QString outputDir_;

    int reportedProgress_ = 0;
};

} // namespace Scribe
