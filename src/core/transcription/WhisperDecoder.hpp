#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <memory>
#include <utility>
#include <vector>

#include "SpeechDecoder.hpp"

struct whisper_context;

namespace WhisperKit {

/**
 * @brief SpeechDecoder backed by whisper.cpp.
 *
 * Loaded contexts are kept per model path and shared between calls; every
 * decode runs on its own whisper_state so concurrent requests do not serialize.
 * A processor count above one splits the audio into that many ranges, decoded
 * side by side with the thread budget divided between them.
 */
class WhisperDecoder : public SpeechDecoder {
public:
    WhisperDecoder();
    ~WhisperDecoder() override;

    WhisperDecoder(const WhisperDecoder&) = delete;
    WhisperDecoder& operator=(const WhisperDecoder&) = delete;

    QJsonObject process(const QJsonObject& request, const std::atomic_bool& abortRequested) override;

    void setUseGpu(bool useGpu);
    void unloadModels();

    // Ranges never shorter than one second, at most `processors` of them
    static constexpr size_t MinChunkSamples = 16000;
    static std::vector<std::pair<size_t, size_t>> chunkRanges(size_t sampleCount, int processors);

    // Linear interpolation to targetRate
    static std::vector<float> resample(const std::vector<float>& samples, quint32 sourceRate, quint32 targetRate);

private:
    class WhisperDecoderPrivate;
    std::unique_ptr<WhisperDecoderPrivate> d;

    QJsonObject transcribe(const QJsonObject& request, const std::atomic_bool& abortRequested);
    QJsonObject version() const;
    whisper_context* contextFor(const QString& modelPath, QString* error);

    static QJsonObject errorResponse(const QString& type, const QString& message);
};

} // namespace WhisperKit
