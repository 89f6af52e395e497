#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/media/AudioConverter.hpp"
#include "PipelineHooks.hpp"
#include "SpeechDecoder.hpp"
#include "TranscriptionTypes.hpp"

namespace WhisperKit {

enum class EngineError {
    InvalidInput,
    Timeout,
    ProcessingFailed,
    DecoderUnavailable
};

struct EngineFailure {
    EngineError code = EngineError::ProcessingFailed;
    QString reason;
};

QString errorToString(EngineError error);

struct EngineOptions {
    int decodeTimeoutMs = 10 * 60 * 1000;
    QString tempPath;   // empty = QDir::tempPath()
    int maxConcurrentDecodes = 0; // 0 = max(4, idealThreadCount)
};

/**
 * @brief Turns a TranscriptionRequest plus a local model into a TranscriptionResult.
 *
 * Holds no per-job state. Audio that is not already 16 kHz mono s16le is
 * handed to the converter; if conversion fails the original file is decoded
 * as-is and the result is flagged with conversionFallback.
 *
 * The decoder call runs on the engine's own thread pool. The timeout starts
 * once a pool thread picks the call up. When the call overruns it, transcribe() returns EngineError::Timeout immediately and the call
 * is asked to abort; temporary files are removed once it actually stops.
 */
class TranscriptionEngine {
public:
    TranscriptionEngine(std::shared_ptr<SpeechDecoder> decoder,
                        std::shared_ptr<AudioConverter> converter,
                        PipelineHooks hooks = {},
                        EngineOptions options = {});
    ~TranscriptionEngine();

    TranscriptionEngine(const TranscriptionEngine&) = delete;
    TranscriptionEngine& operator=(const TranscriptionEngine&) = delete;

    Expected<TranscriptionResult, EngineFailure> transcribe(const TranscriptionRequest& request,
                                                            const QString& modelPath);

    // Empty when the decoder does not answer
    QString decoderVersion();

    void setDecodeTimeout(int timeoutMs);
    int decodeTimeout() const;

    // QThread::idealThreadCount() clamped to [1, 8]
    static int defaultThreadCount();
    // Positive hints are clamped to [1, 8]; anything else falls back to the default
    static int resolveThreadCount(int hint);

    static QJsonObject buildDecoderRequest(const TranscriptionRequest& request,
                                           const QString& modelPath,
                                           const QString& audioPath,
                                           int threads,
                                           int processors);
    static Expected<TranscriptionResult, EngineFailure> parseDecoderResponse(const QJsonObject& response);

private:
    class TranscriptionEnginePrivate;
    std::unique_ptr<TranscriptionEnginePrivate> d;

    Expected<QJsonObject, EngineFailure> runDecoder(const QJsonObject& request, QStringList* temporaryFiles);
    QString prepareAudio(const QString& audioPath, bool* fallback, bool* requiredFormat, QStringList* temporaryFiles);
    QString applyPreprocessors(const QString& wavPath, QStringList* temporaryFiles);
    TranscriptionResult applyPostprocessing(TranscriptionResult result) const;
    QString makeTempPath(const QString& tag) const;
};

} // namespace WhisperKit
