#include "WhisperDecoder.hpp"
#include "core/common/Logger.hpp"
#include "core/media/WavFormat.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QHash>
#include <QtCore/QJsonArray>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtConcurrent/QtConcurrent>

#include <whisper.h>
#include <mutex>
#include <string>

#ifndef WHISPERKIT_WHISPER_VERSION
#define WHISPERKIT_WHISPER_VERSION "unknown"
#endif

namespace WhisperKit {

namespace {

struct LoadedModel {
    explicit LoadedModel(whisper_context* context) : ctx(context) {}
    ~LoadedModel() {
        if (ctx) {
            whisper_free(ctx);
        }
    }

    whisper_context* ctx = nullptr;
};

void installWhisperLogHandler() {
    static std::once_flag once;
    std::call_once(once, []() {
        whisper_log_set([](enum ggml_log_level level, const char* text, void* userData) {
            Q_UNUSED(userData)
            const std::string message = QString::fromUtf8(text).trimmed().toStdString();
            if (message.empty()) {
                return;
            }
            switch (level) {
                case GGML_LOG_LEVEL_ERROR:
                    WHISPERKIT_ERROR("whisper: {}", message);
                    break;
                case GGML_LOG_LEVEL_WARN:
                    WHISPERKIT_WARN("whisper: {}", message);
                    break;
                default:
                    WHISPERKIT_TRACE("whisper: {}", message);
                    break;
            }
        }, nullptr);
    });
}

bool abortCallback(void* userData) {
    return static_cast<const std::atomic_bool*>(userData)->load();
}

struct ChunkOutput {
    int status = 0;
    QString text;
    QJsonArray segments;
    QString language;
};

ChunkOutput decodeChunk(whisper_context* ctx, whisper_full_params params,
                        const float* samples, size_t count, size_t sampleOffset, int threads) {
    ChunkOutput output;
    whisper_state* state = whisper_init_state(ctx);
    if (!state) {
        output.status = -1;
        return output;
    }

    params.n_threads = threads;
    output.status = whisper_full_with_state(ctx, state, params, samples, static_cast<int>(count));
    if (output.status == 0) {
        // Segment times are centiseconds relative to the chunk start
        const qint64 offset = static_cast<qint64>(sampleOffset) * 100 / WHISPER_SAMPLE_RATE;
        const int segmentCount = whisper_full_n_segments_from_state(state);
        for (int i = 0; i < segmentCount; ++i) {
            const QString piece = QString::fromUtf8(whisper_full_get_segment_text_from_state(state, i));
            output.text += piece;
            QJsonObject segment;
            segment["from_ts"] = offset + whisper_full_get_segment_t0_from_state(state, i);
            segment["to_ts"] = offset + whisper_full_get_segment_t1_from_state(state, i);
            segment["text"] = piece;
            output.segments.append(segment);
        }
        output.language = QString::fromUtf8(whisper_lang_str(whisper_full_lang_id_from_state(state)));
    }
    whisper_free_state(state);
    return output;
}

} // namespace

class WhisperDecoder::WhisperDecoderPrivate {
public:
    QMutex mutex;
    QHash<QString, std::shared_ptr<LoadedModel>> models;
    bool useGpu = true;
};

WhisperDecoder::WhisperDecoder()
    : d(std::make_unique<WhisperDecoderPrivate>()) {
    installWhisperLogHandler();
}

WhisperDecoder::~WhisperDecoder() = default;

void WhisperDecoder::setUseGpu(bool useGpu) {
    QMutexLocker locker(&d->mutex);
    d->useGpu = useGpu;
}

void WhisperDecoder::unloadModels() {
    QMutexLocker locker(&d->mutex);
    // Calls in progress keep their own reference
    d->models.clear();
}

QJsonObject WhisperDecoder::process(const QJsonObject& request, const std::atomic_bool& abortRequested) {
    const QString type = request.value("@type").toString();
    if (type == DecoderRequest::TranscribeType) {
        return transcribe(request, abortRequested);
    }
    if (type == DecoderRequest::VersionType) {
        return version();
    }
    return errorResponse(type, QString("Unsupported request type '%1'").arg(type));
}

whisper_context* WhisperDecoder::contextFor(const QString& modelPath, QString* error) {
    QMutexLocker locker(&d->mutex);
    auto it = d->models.constFind(modelPath);
    if (it != d->models.constEnd()) {
        return it.value()->ctx;
    }

    if (!QFileInfo(modelPath).isFile()) {
        *error = QString("Model file not found: %1").arg(modelPath);
        return nullptr;
    }

    whisper_context_params params = whisper_context_default_params();
    params.use_gpu = d->useGpu;

    WHISPERKIT_INFO("Loading whisper model {}", modelPath.toStdString());
    const std::string path = modelPath.toStdString();
    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), params);
    if (!ctx) {
        *error = QString("Failed to load model %1").arg(modelPath);
        return nullptr;
    }

    d->models.insert(modelPath, std::make_shared<LoadedModel>(ctx));
    return ctx;
}

QJsonObject WhisperDecoder::transcribe(const QJsonObject& request, const std::atomic_bool& abortRequested) {
    const QString type = DecoderRequest::TranscribeType;
    const QString modelPath = request.value("model").toString();
    const QString audioPath = request.value("audio").toString();

    QString loadError;
    if (!contextFor(modelPath, &loadError)) {
        return errorResponse(type, loadError);
    }

    std::shared_ptr<LoadedModel> model;
    {
        QMutexLocker locker(&d->mutex);
        model = d->models.value(modelPath);
    }
    if (!model) {
        return errorResponse(type, QString("Model %1 was unloaded").arg(modelPath));
    }

    auto wavInfo = WavFormat::inspect(audioPath);
    if (wavInfo.hasError()) {
        return errorResponse(type, QString("%1: %2").arg(errorToString(wavInfo.error()), audioPath));
    }
    auto samples = WavFormat::readSamples(audioPath);
    if (samples.hasError()) {
        return errorResponse(type, QString("%1: %2").arg(errorToString(samples.error()), audioPath));
    }

    std::vector<float> pcm = std::move(samples).value();
    if (wavInfo.value().sampleRate != WHISPER_SAMPLE_RATE) {
        pcm = resample(pcm, wavInfo.value().sampleRate, WHISPER_SAMPLE_RATE);
    }
    if (pcm.empty()) {
        return errorResponse(type, QString("No audio samples in %1").arg(audioPath));
    }

    const QString language = request.value("language").toString(QStringLiteral("auto"));
    const std::string languageStd = language.isEmpty() ? std::string("auto") : language.toStdString();
    const int threads = qMax(1, request.value("threads").toInt(1));
    const int processors = qMax(1, request.value("processors").toInt(1));

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = threads;
    params.language = languageStd.c_str();
    params.detect_language = false;
    params.translate = request.value("is_translate").toBool(false);
    params.no_timestamps = request.value("is_no_timestamps").toBool(false);
    params.split_on_word = request.value("split_on_word").toBool(false);
    params.print_progress = false;
    params.print_realtime = false;
    params.print_special = false;
    params.print_timestamps = false;
    params.abort_callback = abortCallback;
    params.abort_callback_user_data = const_cast<std::atomic_bool*>(&abortRequested);

    QElapsedTimer timer;
    timer.start();

    // Each range decodes on its own state; extra ranges run on the global pool
    const auto ranges = chunkRanges(pcm.size(), processors);
    const int threadsPerChunk = qMax(1, threads / static_cast<int>(ranges.size()));
    whisper_context* ctx = model->ctx;

    auto decodeRange = [ctx, &params, &pcm, threadsPerChunk](const std::pair<size_t, size_t>& range) {
        return decodeChunk(ctx, params, pcm.data() + range.first, range.second - range.first,
                           range.first, threadsPerChunk);
    };

    QList<QFuture<ChunkOutput>> pending;
    for (size_t i = 1; i < ranges.size(); ++i) {
        pending.append(QtConcurrent::run(decodeRange, ranges[i]));
    }
    std::vector<ChunkOutput> outputs;
    outputs.push_back(decodeRange(ranges.front()));
    for (auto& future : pending) {
        outputs.push_back(future.result());
    }

    QJsonArray segments;
    QString text;
    QString detectedLanguage;
    for (const ChunkOutput& output : outputs) {
        if (output.status != 0) {
            if (abortRequested.load()) {
                return errorResponse(type, QStringLiteral("Decoding aborted"));
            }
            return errorResponse(type, QString("whisper_full failed with code %1").arg(output.status));
        }
        text += output.text;
        for (const QJsonValue& segment : output.segments) {
            segments.append(segment);
        }
        if (detectedLanguage.isEmpty()) {
            detectedLanguage = output.language;
        }
    }

    if (abortRequested.load()) {
        return errorResponse(type, QStringLiteral("Decoding aborted"));
    }

    WHISPERKIT_DEBUG("Decoded {} in {} ms ({} segments, {} chunks x {} threads)",
                     audioPath.toStdString(), timer.elapsed(), segments.size(), ranges.size(), threadsPerChunk);

    QJsonObject response;
    response["@type"] = type;
    response["text"] = text.trimmed();
    response["segments"] = segments;
    response["language"] = detectedLanguage.isEmpty() ? language : detectedLanguage;
    return response;
}

QJsonObject WhisperDecoder::version() const {
    QJsonObject response;
    response["@type"] = DecoderRequest::VersionType;
    response["version"] = QStringLiteral(WHISPERKIT_WHISPER_VERSION);
    response["system_info"] = QString::fromUtf8(whisper_print_system_info()).trimmed();
    return response;
}

std::vector<std::pair<size_t, size_t>> WhisperDecoder::chunkRanges(size_t sampleCount, int processors) {
    std::vector<std::pair<size_t, size_t>> ranges;
    const size_t maxChunks = qMax<size_t>(1, sampleCount / MinChunkSamples);
    const size_t chunks = qBound<size_t>(1, static_cast<size_t>(qMax(1, processors)), maxChunks);
    const size_t chunkSize = sampleCount / chunks;

    size_t begin = 0;
    for (size_t i = 0; i < chunks; ++i) {
        const size_t end = (i + 1 == chunks) ? sampleCount : begin + chunkSize;
        ranges.emplace_back(begin, end);
        begin = end;
    }
    return ranges;
}

std::vector<float> WhisperDecoder::resample(const std::vector<float>& samples, quint32 sourceRate, quint32 targetRate) {
    if (sourceRate == 0 || sourceRate == targetRate || samples.empty()) {
        return samples;
    }

    const double ratio = static_cast<double>(targetRate) / sourceRate;
    const size_t outputSize = static_cast<size_t>(samples.size() * ratio);
    std::vector<float> output;
    output.reserve(outputSize);

    for (size_t i = 0; i < outputSize; ++i) {
        const double sourceIndex = i / ratio;
        const size_t index = static_cast<size_t>(sourceIndex);
        if (index + 1 < samples.size()) {
            const float fraction = static_cast<float>(sourceIndex - index);
            output.push_back(samples[index] * (1.0f - fraction) + samples[index + 1] * fraction);
        } else {
            output.push_back(samples.back());
        }
    }
    return output;
}

QJsonObject WhisperDecoder::errorResponse(const QString& type, const QString& message) {
    WHISPERKIT_ERROR("Decoder: {}", message.toStdString());
    QJsonObject response;
    response["@type"] = type;
    response["message"] = message;
    return response;
}

} // namespace WhisperKit
