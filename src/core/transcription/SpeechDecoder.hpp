#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <atomic>

namespace WhisperKit {

namespace DecoderRequest {
inline const QString TranscribeType = QStringLiteral("getTextFromWavFile");
inline const QString VersionType = QStringLiteral("getVersion");
}

/**
 * @brief Contract of the native speech decoder.
 *
 * A request is a JSON object tagged by "@type". A transcription response
 * carries "text" and optional "segments" ([{from_ts, to_ts, text}] in
 * centiseconds) and "language"; a failed call omits "text" and sets "message".
 *
 * process() may be called from several threads at once. It should return
 * early once abortRequested becomes true.
 */
class SpeechDecoder {
public:
    virtual ~SpeechDecoder() = default;

    virtual QJsonObject process(const QJsonObject& request, const std::atomic_bool& abortRequested) = 0;
    virtual bool isAvailable() const { return true; }
};

} // namespace WhisperKit
