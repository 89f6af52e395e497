#include "WavFormat.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QSaveFile>
#include <QtCore/QtEndian>

namespace WhisperKit {

namespace {

constexpr qint64 RiffHeaderSize = 12;
constexpr qint64 ChunkHeaderSize = 8;
constexpr qint64 MinFmtChunkSize = 16;

quint16 readU16(const char* data) {
    return qFromLittleEndian<quint16>(reinterpret_cast<const uchar*>(data));
}

quint32 readU32(const char* data) {
    return qFromLittleEndian<quint32>(reinterpret_cast<const uchar*>(data));
}

void appendU16(QByteArray& out, quint16 value) {
    char buffer[2];
    qToLittleEndian<quint16>(value, reinterpret_cast<uchar*>(buffer));
    out.append(buffer, 2);
}

void appendU32(QByteArray& out, quint32 value) {
    char buffer[4];
    qToLittleEndian<quint32>(value, reinterpret_cast<uchar*>(buffer));
    out.append(buffer, 4);
}

} // namespace

QString errorToString(WavError error) {
    switch (error) {
        case WavError::OpenFailed: return QStringLiteral("Cannot open audio file");
        case WavError::NotWav: return QStringLiteral("Not a RIFF/WAVE file");
        case WavError::Truncated: return QStringLiteral("WAV file is truncated");
        case WavError::UnsupportedFormat: return QStringLiteral("Unsupported WAV sample format");
        case WavError::WriteFailed: return QStringLiteral("Cannot write WAV file");
    }
    return QStringLiteral("WAV error");
}

bool WavInfo::isRequiredFormat() const {
    return audioFormat == 1
        && channels == WavFormat::RequiredChannels
        && sampleRate == WavFormat::RequiredSampleRate
        && bitsPerSample == WavFormat::RequiredBitsPerSample;
}

qint64 WavInfo::durationMs() const {
    const qint64 bytesPerSecond = qint64(sampleRate) * channels * (bitsPerSample / 8);
    return bytesPerSecond > 0 ? dataSize * 1000 / bytesPerSecond : 0;
}

Expected<WavInfo, WavError> WavFormat::inspect(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return makeUnexpected(WavError::OpenFailed);
    }

    const QByteArray riff = file.read(RiffHeaderSize);
    if (riff.size() < RiffHeaderSize) {
        return makeUnexpected(WavError::NotWav);
    }
    if (!riff.startsWith("RIFF") || riff.mid(8, 4) != "WAVE") {
        return makeUnexpected(WavError::NotWav);
    }

    WavInfo info;
    bool haveFormat = false;
    qint64 offset = RiffHeaderSize;

    while (offset + ChunkHeaderSize <= file.size()) {
        if (!file.seek(offset)) {
            return makeUnexpected(WavError::Truncated);
        }
        const QByteArray chunkHeader = file.read(ChunkHeaderSize);
        if (chunkHeader.size() < ChunkHeaderSize) {
            return makeUnexpected(WavError::Truncated);
        }

        const QByteArray chunkId = chunkHeader.left(4);
        const qint64 chunkSize = readU32(chunkHeader.constData() + 4);
        const qint64 bodyOffset = offset + ChunkHeaderSize;

        if (chunkId == "fmt ") {
            if (chunkSize < MinFmtChunkSize) {
                return makeUnexpected(WavError::Truncated);
            }
            const QByteArray fmt = file.read(MinFmtChunkSize);
            if (fmt.size() < MinFmtChunkSize) {
                return makeUnexpected(WavError::Truncated);
            }
            info.audioFormat = readU16(fmt.constData());
            info.channels = readU16(fmt.constData() + 2);
            info.sampleRate = readU32(fmt.constData() + 4);
            info.bitsPerSample = readU16(fmt.constData() + 14);
            haveFormat = true;
        } else if (chunkId == "data") {
            if (!haveFormat) {
                return makeUnexpected(WavError::NotWav);
            }
            info.dataOffset = bodyOffset;
            // Streams written by pipes often leave the size field unset
            info.dataSize = qMin(chunkSize, file.size() - bodyOffset);
            return info;
        }

        // Chunks are padded to an even length
        offset = bodyOffset + chunkSize + (chunkSize & 1);
    }

    return makeUnexpected(WavError::Truncated);
}

Expected<QByteArray, WavError> WavFormat::readPcm(const QString& path, WavInfo* info) {
    auto inspected = inspect(path);
    if (inspected.hasError()) {
        return makeUnexpected(inspected.error());
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly) || !file.seek(inspected.value().dataOffset)) {
        return makeUnexpected(WavError::OpenFailed);
    }

    QByteArray pcm = file.read(inspected.value().dataSize);
    if (pcm.size() != inspected.value().dataSize) {
        return makeUnexpected(WavError::Truncated);
    }

    if (info) {
        *info = inspected.value();
    }
    return pcm;
}

Expected<std::vector<float>, WavError> WavFormat::readSamples(const QString& path) {
    WavInfo info;
    auto pcm = readPcm(path, &info);
    if (pcm.hasError()) {
        return makeUnexpected(pcm.error());
    }

    if (info.audioFormat != 1 || info.bitsPerSample != 16 || info.channels == 0) {
        WHISPERKIT_ERROR("Unsupported WAV layout in {}: format {}, {} bits, {} channels",
                         path.toStdString(), info.audioFormat, info.bitsPerSample, info.channels);
        return makeUnexpected(WavError::UnsupportedFormat);
    }

    const QByteArray& bytes = pcm.value();
    const qint64 frameCount = bytes.size() / (2 * info.channels);
    const char* data = bytes.constData();

    std::vector<float> samples;
    samples.reserve(static_cast<size_t>(frameCount));
    for (qint64 frame = 0; frame < frameCount; ++frame) {
        // Down-mix by averaging channels
        float sum = 0.0f;
        for (quint16 channel = 0; channel < info.channels; ++channel) {
            const qint64 byteOffset = (frame * info.channels + channel) * 2;
            sum += static_cast<float>(static_cast<qint16>(readU16(data + byteOffset))) / 32768.0f;
        }
        samples.push_back(sum / info.channels);
    }

    if (info.sampleRate != RequiredSampleRate) {
        WHISPERKIT_WARN("{} is {} Hz, expected {} Hz", path.toStdString(), info.sampleRate, RequiredSampleRate);
    }
    return samples;
}

Expected<void, WavError> WavFormat::writePcm(const QString& path, const QByteArray& pcm,
                                             quint32 sampleRate, quint16 channels, quint16 bitsPerSample) {
    const quint16 blockAlign = channels * (bitsPerSample / 8);

    QByteArray out;
    out.reserve(44 + pcm.size());
    out.append("RIFF", 4);
    appendU32(out, static_cast<quint32>(36 + pcm.size()));
    out.append("WAVE", 4);
    out.append("fmt ", 4);
    appendU32(out, 16);
    appendU16(out, 1);
    appendU16(out, channels);
    appendU32(out, sampleRate);
    appendU32(out, sampleRate * blockAlign);
    appendU16(out, blockAlign);
    appendU16(out, bitsPerSample);
    out.append("data", 4);
    appendU32(out, static_cast<quint32>(pcm.size()));
    out.append(pcm);

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return makeUnexpected(WavError::WriteFailed);
    }
    if (file.write(out) != out.size() || !file.commit()) {
        return makeUnexpected(WavError::WriteFailed);
    }
    return Expected<void, WavError>();
}

} // namespace WhisperKit
