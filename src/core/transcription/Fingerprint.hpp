#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include "core/common/Expected.hpp"
#include "TranscriptionEngine.hpp"
#include "TranscriptionTypes.hpp"

namespace WhisperKit {

/**
 * @brief Cache and de-duplication key for a transcription request.
 *
 * SHA-256 over the audio bytes, the model name and every option that changes
 * the decoded text (language, translate, timestamps, word splitting). Priority
 * and thread hints are deliberately left out.
 */
class Fingerprint {
public:
    static Expected<QString, EngineFailure> compute(const TranscriptionRequest& request);

    static QByteArray hashAudio(const QString& audioPath, bool* ok);
    static QString combine(const QByteArray& audioDigest, const TranscriptionRequest& request);
};

} // namespace WhisperKit
