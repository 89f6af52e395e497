#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <vector>

#include "core/common/Expected.hpp"

namespace WhisperKit {

enum class WavError {
    OpenFailed,
    NotWav,
    Truncated,
    UnsupportedFormat,
    WriteFailed
};

QString errorToString(WavError error);

struct WavInfo {
    quint16 audioFormat = 0;     // 1 = integer PCM
    quint16 channels = 0;
    quint32 sampleRate = 0;
    quint16 bitsPerSample = 0;
    qint64 dataOffset = 0;
    qint64 dataSize = 0;

    // 16 kHz, mono, 16-bit signed PCM
    bool isRequiredFormat() const;
    qint64 durationMs() const;
};

/**
 * @brief Minimal RIFF/WAVE reader and writer.
 *
 * Walks the chunk list instead of assuming a 44-byte header, so files with
 * LIST or fact chunks before "data" are handled.
 */
class WavFormat {
public:
    static constexpr quint32 RequiredSampleRate = 16000;
    static constexpr quint16 RequiredChannels = 1;
    static constexpr quint16 RequiredBitsPerSample = 16;

    static Expected<WavInfo, WavError> inspect(const QString& path);
    static Expected<QByteArray, WavError> readPcm(const QString& path, WavInfo* info = nullptr);

    // Mono 16-bit samples normalized to [-1, 1)
    static Expected<std::vector<float>, WavError> readSamples(const QString& path);

    static Expected<void, WavError> writePcm(const QString& path, const QByteArray& pcm,
                                             quint32 sampleRate = RequiredSampleRate,
                                             quint16 channels = RequiredChannels,
                                             quint16 bitsPerSample = RequiredBitsPerSample);
};

} // namespace WhisperKit
