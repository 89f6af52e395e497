#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "AudioConverter.hpp"

namespace WhisperKit {

/**
 * @brief Runs an external ffmpeg process to normalize audio for the decoder.
 *
 * Equivalent to `ffmpeg -i <in> -ar 16000 -ac 1 -c:a pcm_s16le -y <out>`.
 */
class FfmpegAudioConverter : public AudioConverter {
public:
    explicit FfmpegAudioConverter(QString ffmpegPath = QStringLiteral("ffmpeg"), int timeoutMs = 60000);

    Expected<void, ConversionFailure> convert(const QString& inputPath, const QString& outputPath) override;

    const QString& ffmpegPath() const { return ffmpegPath_; }
    int timeoutMs() const { return timeoutMs_; }

    static QStringList buildArguments(const QString& inputPath, const QString& outputPath);

private:
    QString ffmpegPath_;
    int timeoutMs_;
};

} // namespace WhisperKit
