#include "Fingerprint.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QCryptographicHash>
#include <QtCore/QFile>

namespace WhisperKit {

Expected<QString, EngineFailure> Fingerprint::compute(const TranscriptionRequest& request) {
    bool ok = false;
    const QByteArray digest = hashAudio(request.audioPath, &ok);
    if (!ok) {
        return makeUnexpected(EngineFailure{EngineError::InvalidInput,
                                            QString("Cannot read audio file: %1").arg(request.audioPath)});
    }
    return combine(digest, request);
}

QByteArray Fingerprint::hashAudio(const QString& audioPath, bool* ok) {
    *ok = false;
    QFile file(audioPath);
    if (!file.open(QIODevice::ReadOnly)) {
        WHISPERKIT_WARN("Cannot open {} for hashing: {}", audioPath.toStdString(), file.errorString().toStdString());
        return QByteArray();
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        WHISPERKIT_WARN("Failed to read {} for hashing", audioPath.toStdString());
        return QByteArray();
    }

    *ok = true;
    return hash.result();
}

QString Fingerprint::combine(const QByteArray& audioDigest, const TranscriptionRequest& request) {
    const QString language = request.language.isEmpty() ? AutoDetectLanguage : request.language;

    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(audioDigest);
    // Length-prefix each field so adjacent values cannot run together
    for (const QString& field : {request.modelName, language}) {
        const QByteArray bytes = field.toUtf8();
        hash.addData(QByteArray::number(bytes.size()) + ':');
        hash.addData(bytes);
    }
    hash.addData(QByteArray(request.translate ? "T" : "t"));
    hash.addData(QByteArray(request.emitTimestamps ? "S" : "s"));
    hash.addData(QByteArray(request.splitOnWord ? "W" : "w"));
    return QString::fromLatin1(hash.result().toHex());
}

} // namespace WhisperKit
