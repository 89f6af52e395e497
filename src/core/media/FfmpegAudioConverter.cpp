#include "FfmpegAudioConverter.hpp"
#include "WavFormat.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <utility>

namespace WhisperKit {

FfmpegAudioConverter::FfmpegAudioConverter(QString ffmpegPath, int timeoutMs)
    : ffmpegPath_(std::move(ffmpegPath))
    , timeoutMs_(timeoutMs > 0 ? timeoutMs : 60000) {
}

QStringList FfmpegAudioConverter::buildArguments(const QString& inputPath, const QString& outputPath) {
    QStringList arguments;
    arguments << "-hide_banner" << "-loglevel" << "error"
              << "-i" << inputPath
              << "-ar" << QString::number(WavFormat::RequiredSampleRate)
              << "-ac" << QString::number(WavFormat::RequiredChannels)
              << "-c:a" << "pcm_s16le"
              << "-y" << outputPath;
    return arguments;
}

Expected<void, ConversionFailure> FfmpegAudioConverter::convert(const QString& inputPath, const QString& outputPath) {
    QProcess ffmpeg;
    ffmpeg.start(ffmpegPath_, buildArguments(inputPath, outputPath));

    if (!ffmpeg.waitForStarted()) {
        WHISPERKIT_ERROR("Failed to start {}: {}", ffmpegPath_.toStdString(), ffmpeg.errorString().toStdString());
        return makeUnexpected(ConversionFailure{ConversionError::ToolUnavailable,
                                                QString("Cannot start %1: %2").arg(ffmpegPath_, ffmpeg.errorString())});
    }

    if (!ffmpeg.waitForFinished(timeoutMs_)) {
        ffmpeg.kill();
        if (!ffmpeg.waitForFinished(1000)) {
            WHISPERKIT_WARN("ffmpeg did not exit after kill");
        }
        WHISPERKIT_ERROR("ffmpeg conversion of {} timed out", inputPath.toStdString());
        return makeUnexpected(ConversionFailure{ConversionError::Timeout,
                                                QString("Conversion timed out after %1 ms").arg(timeoutMs_)});
    }

    if (ffmpeg.exitStatus() != QProcess::NormalExit || ffmpeg.exitCode() != 0) {
        const QString stderrText = QString::fromUtf8(ffmpeg.readAllStandardError()).trimmed();
        WHISPERKIT_ERROR("ffmpeg conversion failed ({}): {}", ffmpeg.exitCode(), stderrText.toStdString());
        return makeUnexpected(ConversionFailure{ConversionError::Failed,
                                                QString("ffmpeg exited with %1: %2").arg(ffmpeg.exitCode()).arg(stderrText)});
    }

    if (!QFileInfo(outputPath).isFile() || QFileInfo(outputPath).size() == 0) {
        return makeUnexpected(ConversionFailure{ConversionError::Failed,
                                                QString("ffmpeg produced no output at %1").arg(outputPath)});
    }

    WHISPERKIT_DEBUG("Converted {} -> {}", inputPath.toStdString(), outputPath.toStdString());
    return Expected<void, ConversionFailure>();
}

} // namespace WhisperKit
