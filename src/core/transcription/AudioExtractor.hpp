#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <functional>
#include <optional>
#include "../common/Expected.hpp"

namespace Scribe {

struct ExtractedAudio {
    QString wavPath;
    qint64 durationMs = 0;  // 0 when the tool did not report one
};

/**
 * @brief Converts a downloaded track into the recognizer's input format
 */
class AudioExtractor {
public:
    using LogSink = std::function<void(const QString& line)>;

    virtual ~AudioExtractor() = default;

    virtual Expected<ExtractedAudio, QString> extract(const QString& inputPath,
                                                      const QString& outputWavPath,
                                                      const LogSink& onLog) = 0;
};

/**
 * @brief ffmpeg based extraction to 16 kHz mono signed 16-bit PCM
 */
class FfmpegExtractor : public AudioExtractor {
public:
    explicit FfmpegExtractor(QString ffmpegPath);

    Expected<ExtractedAudio, QString> extract(const QString& inputPath,
                                              const QString& outputWavPath,
                                              const LogSink& onLog) override;

    const QString& ffmpegPath() const { return ffmpegPath_; }

    static QStringList arguments(const QString& inputPath, const QString& outputWavPath);

    // "Duration: 00:01:02.50, start: ..." -> 62500
    static std::optional<qint64> parseDuration(const QString& line);

    static constexpr int SAMPLE_RATE = 16000;
    static constexpr int CHANNELS = 1;

private:
    QString ffmpegPath_;
};

} // namespace Scribe
