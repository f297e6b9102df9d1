#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <functional>
#include "RecognitionOutputParser.hpp"
#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"

namespace Scribe {

struct RecognitionRequest {
    QString audioPath;
    QString outputBase;     // engine writes <outputBase>.json / .txt
    QString modelPath;
    QString language = QStringLiteral("ja");
    qint64 audioDurationMs = 0;
};

/**
 * @brief Speech-to-text engine run over one extracted audio file
 *
 * Progress is reported through the callback in the order the engine
 * produces it.
 */
class SpeechRecognizer {
public:
    using ProgressSink = std::function<void(const ProgressDelta& delta)>;

    virtual ~SpeechRecognizer() = default;

    virtual Expected<QList<TranscriptSegment>, QString> recognize(const RecognitionRequest& request,
                                                                  const ProgressSink& onProgress) = 0;
};

class WhisperCliRecognizer : public SpeechRecognizer {
public:
    explicit WhisperCliRecognizer(QString binaryPath);

    Expected<QList<TranscriptSegment>, QString> recognize(const RecognitionRequest& request,
                                                          const ProgressSink& onProgress) override;

    const QString& binaryPath() const { return binaryPath_; }

    static QStringList arguments(const RecognitionRequest& request);

private:
    QString binaryPath_;
};

} // namespace Scribe
