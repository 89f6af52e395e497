#include "TranscriptionEngine.hpp"
#include "core/common/Logger.hpp"
#include "core/media/WavFormat.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QThread>
#include <QtCore/QThreadPool>
#include <QtCore/QUuid>
#include <QtCore/QWaitCondition>
#include <algorithm>
#include <atomic>

namespace WhisperKit {

namespace {

constexpr int MinThreads = 1;
constexpr int MaxThreads = 8;

// Shared between the caller and the pool task so either side may finish last
struct DecodeCall {
    QMutex mutex;
    QWaitCondition finishedCondition;
    bool started = false;
    bool finished = false;
    bool abandoned = false;
    QJsonObject response;
    QStringList orphanedFiles;
    std::atomic_bool abortRequested{false};
};

void removeTemporaryFiles(const QStringList& paths) {
    for (const QString& path : paths) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            WHISPERKIT_WARN("Could not remove temporary file {}", path.toStdString());
        }
    }
}

} // namespace

QString errorToString(EngineError error) {
    switch (error) {
        case EngineError::InvalidInput: return QStringLiteral("Invalid input");
        case EngineError::Timeout: return QStringLiteral("Transcription timed out");
        case EngineError::ProcessingFailed: return QStringLiteral("Transcription failed");
        case EngineError::DecoderUnavailable: return QStringLiteral("Speech decoder unavailable");
    }
    return QStringLiteral("Engine error");
}

class TranscriptionEngine::TranscriptionEnginePrivate {
public:
    std::shared_ptr<SpeechDecoder> decoder;
    std::shared_ptr<AudioConverter> converter;
    PipelineHooks hooks;
    EngineOptions options;
    std::atomic<int> decodeTimeoutMs{0};
    QThreadPool pool;
};

TranscriptionEngine::TranscriptionEngine(std::shared_ptr<SpeechDecoder> decoder,
                                         std::shared_ptr<AudioConverter> converter,
                                         PipelineHooks hooks,
                                         EngineOptions options)
    : d(std::make_unique<TranscriptionEnginePrivate>()) {
    d->decoder = std::move(decoder);
    d->converter = std::move(converter);
    d->hooks = std::move(hooks);
    d->options = std::move(options);
    d->decodeTimeoutMs = d->options.decodeTimeoutMs;
    const int poolSize = d->options.maxConcurrentDecodes > 0
        ? d->options.maxConcurrentDecodes
        : qMax(4, QThread::idealThreadCount());
    d->pool.setMaxThreadCount(poolSize);
}

TranscriptionEngine::~TranscriptionEngine() {
    d->pool.waitForDone();
}

void TranscriptionEngine::setDecodeTimeout(int timeoutMs) {
    d->decodeTimeoutMs = timeoutMs;
}

int TranscriptionEngine::decodeTimeout() const {
    return d->decodeTimeoutMs;
}

int TranscriptionEngine::defaultThreadCount() {
    return std::clamp(QThread::idealThreadCount(), MinThreads, MaxThreads);
}

int TranscriptionEngine::resolveThreadCount(int hint) {
    return hint > 0 ? std::clamp(hint, MinThreads, MaxThreads) : defaultThreadCount();
}

Expected<TranscriptionResult, EngineFailure> TranscriptionEngine::transcribe(const TranscriptionRequest& request,
                                                                            const QString& modelPath) {
    QElapsedTimer timer;
    timer.start();

    QFileInfo audioInfo(request.audioPath);
    if (request.audioPath.isEmpty() || !audioInfo.exists() || !audioInfo.isFile()) {
        return makeUnexpected(EngineFailure{EngineError::InvalidInput,
                                            QString("Audio file not found: %1").arg(request.audioPath)});
    }
    if (audioInfo.size() == 0) {
        return makeUnexpected(EngineFailure{EngineError::InvalidInput,
                                            QString("Audio file is empty: %1").arg(request.audioPath)});
    }
    if (modelPath.isEmpty() || !QFileInfo(modelPath).isFile()) {
        return makeUnexpected(EngineFailure{EngineError::InvalidInput,
                                            QString("Model file not found: %1").arg(modelPath)});
    }
    if (!d->decoder || !d->decoder->isAvailable()) {
        return makeUnexpected(EngineFailure{EngineError::DecoderUnavailable,
                                            QStringLiteral("No speech decoder is available")});
    }

    QStringList temporaryFiles;
    bool fallback = false;
    bool requiredFormat = false;
    QString decodePath = prepareAudio(request.audioPath, &fallback, &requiredFormat, &temporaryFiles);
    if (requiredFormat && !d->hooks.preprocessors.empty()) {
        decodePath = applyPreprocessors(decodePath, &temporaryFiles);
    }

    const int threads = resolveThreadCount(request.threads);
    const int processors = resolveThreadCount(request.processors);
    const QJsonObject decoderRequest = buildDecoderRequest(request, modelPath, decodePath, threads, processors);

    WHISPERKIT_INFO("Transcribing {} with {} ({} threads, {} processors)",
                    request.audioPath.toStdString(), QFileInfo(modelPath).fileName().toStdString(),
                    threads, processors);

    auto response = runDecoder(decoderRequest, &temporaryFiles);
    removeTemporaryFiles(temporaryFiles);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }

    auto parsed = parseDecoderResponse(response.value());
    if (parsed.hasError()) {
        WHISPERKIT_ERROR("Decoder failed for {}: {}", request.audioPath.toStdString(),
                         parsed.error().reason.toStdString());
        return parsed;
    }

    TranscriptionResult result = applyPostprocessing(std::move(parsed).value());
    if (result.language.isEmpty()) {
        result.language = request.language;
    }
    result.conversionFallback = fallback;
    result.processingTimeMs = timer.elapsed();

    WHISPERKIT_INFO("Transcribed {} in {} ms ({} segments)",
                    request.audioPath.toStdString(), result.processingTimeMs, result.segments.size());
    return result;
}

QString TranscriptionEngine::prepareAudio(const QString& audioPath, bool* fallback, bool* requiredFormat,
                                          QStringList* temporaryFiles) {
    auto info = WavFormat::inspect(audioPath);
    if (info.hasValue() && info.value().isRequiredFormat()) {
        *requiredFormat = true;
        return audioPath;
    }

    if (!d->converter) {
        WHISPERKIT_WARN("No audio converter configured, decoding {} unconverted", audioPath.toStdString());
        *fallback = true;
        return audioPath;
    }

    const QString convertedPath = makeTempPath(QStringLiteral("converted"));
    temporaryFiles->append(convertedPath);

    auto converted = d->converter->convert(audioPath, convertedPath);
    if (converted.hasError()) {
        WHISPERKIT_WARN("Conversion of {} failed ({}), decoding original file",
                        audioPath.toStdString(), converted.error().reason.toStdString());
        *fallback = true;
        return audioPath;
    }

    auto convertedInfo = WavFormat::inspect(convertedPath);
    *requiredFormat = convertedInfo.hasValue() && convertedInfo.value().isRequiredFormat();
    return convertedPath;
}

QString TranscriptionEngine::applyPreprocessors(const QString& wavPath, QStringList* temporaryFiles) {
    auto pcm = WavFormat::readPcm(wavPath);
    if (pcm.hasError()) {
        WHISPERKIT_WARN("Skipping audio preprocessors for {}: {}",
                        wavPath.toStdString(), errorToString(pcm.error()).toStdString());
        return wavPath;
    }

    QByteArray samples = pcm.value();
    for (const auto& preprocessor : d->hooks.preprocessors) {
        samples = preprocessor->process(samples);
        WHISPERKIT_DEBUG("Audio preprocessor '{}' applied", preprocessor->name().toStdString());
    }

    const QString processedPath = makeTempPath(QStringLiteral("preprocessed"));
    temporaryFiles->append(processedPath);
    auto written = WavFormat::writePcm(processedPath, samples);
    if (written.hasError()) {
        WHISPERKIT_WARN("Could not write preprocessed audio: {}", errorToString(written.error()).toStdString());
        return wavPath;
    }
    return processedPath;
}

TranscriptionResult TranscriptionEngine::applyPostprocessing(TranscriptionResult result) const {
    for (const auto& postprocessor : d->hooks.postprocessors) {
        result = postprocessor->process(result);
    }
    for (const auto& formatter : d->hooks.formatters) {
        result.text = formatter->format(result.text);
    }
    return result;
}

Expected<QJsonObject, EngineFailure> TranscriptionEngine::runDecoder(const QJsonObject& request,
                                                                     QStringList* temporaryFiles) {
    auto call = std::make_shared<DecodeCall>();
    std::shared_ptr<SpeechDecoder> decoder = d->decoder;

    d->pool.start([call, decoder, request]() {
        {
            QMutexLocker locker(&call->mutex);
            call->started = true;
            call->finishedCondition.wakeAll();
        }
        QJsonObject response = decoder->process(request, call->abortRequested);

        QMutexLocker locker(&call->mutex);
        call->response = std::move(response);
        call->finished = true;
        if (call->abandoned) {
            removeTemporaryFiles(call->orphanedFiles);
        }
        call->finishedCondition.wakeAll();
    });

    QMutexLocker locker(&call->mutex);
    // Time spent waiting for a free pool thread does not count against the decode
    while (!call->started && !call->finished) {
        call->finishedCondition.wait(&call->mutex);
    }

    const int timeoutMs = d->decodeTimeoutMs;
    QDeadlineTimer deadline = timeoutMs > 0 ? QDeadlineTimer(timeoutMs) : QDeadlineTimer(QDeadlineTimer::Forever);
    while (!call->finished) {
        if (!call->finishedCondition.wait(&call->mutex, deadline)) {
            break;
        }
    }

    if (!call->finished) {
        call->abandoned = true;
        call->abortRequested = true;
        // The task owns the files now and removes them when the decoder returns
        call->orphanedFiles = *temporaryFiles;
        temporaryFiles->clear();
        WHISPERKIT_ERROR("Decoder call exceeded {} ms, aborting", timeoutMs);
        return makeUnexpected(EngineFailure{EngineError::Timeout,
                                            QString("Decoding exceeded %1 ms").arg(timeoutMs)});
    }

    return call->response;
}

QString TranscriptionEngine::decoderVersion() {
    if (!d->decoder || !d->decoder->isAvailable()) {
        return QString();
    }

    QJsonObject request;
    request["@type"] = DecoderRequest::VersionType;
    QStringList noFiles;
    auto response = runDecoder(request, &noFiles);
    if (response.hasError()) {
        WHISPERKIT_WARN("Decoder version request failed: {}", response.error().reason.toStdString());
        return QString();
    }
    return response.value().value("version").toString();
}

QJsonObject TranscriptionEngine::buildDecoderRequest(const TranscriptionRequest& request,
                                                     const QString& modelPath,
                                                     const QString& audioPath,
                                                     int threads,
                                                     int processors) {
    QJsonObject payload;
    payload["@type"] = DecoderRequest::TranscribeType;
    payload["model"] = modelPath;
    payload["audio"] = audioPath;
    payload["language"] = request.language.isEmpty() ? AutoDetectLanguage : request.language;
    payload["is_translate"] = request.translate;
    payload["threads"] = threads;
    payload["processors"] = processors;
    payload["is_no_timestamps"] = !request.emitTimestamps;
    payload["split_on_word"] = request.splitOnWord;
    return payload;
}

Expected<TranscriptionResult, EngineFailure> TranscriptionEngine::parseDecoderResponse(const QJsonObject& response) {
    if (!response.contains("text") || !response.value("text").isString()) {
        const QString message = response.value("message").toString();
        return makeUnexpected(EngineFailure{EngineError::ProcessingFailed,
                                            message.isEmpty() ? QStringLiteral("Decoder returned no text") : message});
    }

    TranscriptionResult result;
    result.text = response.value("text").toString().trimmed();
    result.language = response.value("language").toString();

    const QJsonArray segments = response.value("segments").toArray();
    for (const QJsonValue& value : segments) {
        const QJsonObject object = value.toObject();
        Segment segment;
        // Decoder offsets are in centiseconds
        segment.startMs = qRound64(object.value("from_ts").toDouble() * 10.0);
        segment.endMs = qRound64(object.value("to_ts").toDouble() * 10.0);
        segment.text = object.value("text").toString().trimmed();
        result.segments.append(segment);
    }
    return result;
}

QString TranscriptionEngine::makeTempPath(const QString& tag) const {
    const QString directory = d->options.tempPath.isEmpty() ? QDir::tempPath() : d->options.tempPath;
    if (!QDir().mkpath(directory)) {
        WHISPERKIT_WARN("Cannot create temp directory {}", directory.toStdString());
    }
    return QDir(directory).filePath(QString("whisperkit_%1_%2.wav")
                                        .arg(tag, QUuid::createUuid().toString(QUuid::WithoutBraces)));
}

} // namespace WhisperKit
