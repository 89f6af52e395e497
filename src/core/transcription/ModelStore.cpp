#include "ModelStore.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QFuture>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QPromise>
#include <optional>

namespace WhisperKit {

using ModelResult = Expected<QString, ModelStoreError>;

const QString ModelStore::DefaultDownloadHost =
    QStringLiteral("https://huggingface.co/ggerganov/whisper.cpp/resolve/main");
const QString ModelStore::PartialSuffix = QStringLiteral(".part");

QString errorToString(ModelError error) {
    switch (error) {
        case ModelError::DownloadFailed: return QStringLiteral("Model download failed");
        case ModelError::CorruptDownload: return QStringLiteral("Downloaded model is corrupt");
        case ModelError::Io: return QStringLiteral("Model storage I/O error");
        case ModelError::UnknownModel: return QStringLiteral("Unknown model");
    }
    return QStringLiteral("Model error");
}

class ModelStore::ModelStorePrivate {
public:
    std::shared_ptr<ModelSource> source;

    mutable QMutex mutex;
    QHash<QString, QFuture<ModelResult>> inFlight;
    QHash<QString, DownloadState> states;
    QString downloadHost = DefaultDownloadHost;
    int downloadTimeoutMs = 0;
    // Magic numbers as they appear on disk; the legacy ones are little-endian uint32s
    QList<QByteArray> signatures = {
        QByteArrayLiteral("lmgg"),  // ggml 0x67676d6c
        QByteArrayLiteral("fmgg"),  // ggmf 0x67676d66
        QByteArrayLiteral("tjgg"),  // ggjt 0x67676a74
        QByteArrayLiteral("GGUF")
    };
    int downloadCount = 0;
};

ModelStore::ModelStore(std::shared_ptr<ModelSource> source, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<ModelStorePrivate>()) {
    d->source = std::move(source);
}

ModelStore::~ModelStore() = default;

ModelResult ModelStore::ensureAvailable(const ModelDescriptor& descriptor,
                                        const DownloadProgressCallback& progress) {
    if (!descriptor.isValid()) {
        return makeUnexpected(ModelStoreError{ModelError::UnknownModel,
                                              QString("Invalid model descriptor '%1'").arg(descriptor.name())});
    }

    if (verifyFile(descriptor.localPath(), descriptor.expectedSize()).hasValue()) {
        setState(descriptor.name(), DownloadState::completed(QFileInfo(descriptor.localPath()).size()));
        return descriptor.localPath();
    }

    return acquire(descriptor, progress, true);
}

ModelResult ModelStore::download(const ModelDescriptor& descriptor, const DownloadProgressCallback& progress) {
    if (!descriptor.isValid()) {
        return makeUnexpected(ModelStoreError{ModelError::UnknownModel,
                                              QString("Invalid model descriptor '%1'").arg(descriptor.name())});
    }
    return acquire(descriptor, progress, false);
}

ModelResult ModelStore::acquire(const ModelDescriptor& descriptor,
                                const DownloadProgressCallback& progress,
                                bool reuseExisting) {
    const QString name = descriptor.name();
    QFuture<ModelResult> pending;
    std::optional<QPromise<ModelResult>> promise;

    {
        QMutexLocker locker(&d->mutex);
        auto it = d->inFlight.constFind(name);
        if (it != d->inFlight.constEnd()) {
            pending = it.value();
        } else {
            promise.emplace();
            promise->start();
            d->inFlight.insert(name, promise->future());
        }
    }

    if (!promise) {
        WHISPERKIT_DEBUG("Model '{}' is already being fetched, waiting for it", name.toStdString());
        pending.waitForFinished();
        return pending.result();
    }

    ModelResult result = ModelResult(QString());
    // Another caller may have finished the same download between our check and the lock
    if (reuseExisting && verifyFile(descriptor.localPath(), descriptor.expectedSize()).hasValue()) {
        setState(name, DownloadState::completed(QFileInfo(descriptor.localPath()).size()));
        result = descriptor.localPath();
    } else {
        result = performDownload(descriptor, progress);
    }

    promise->addResult(result);
    promise->finish();

    {
        QMutexLocker locker(&d->mutex);
        d->inFlight.remove(name);
    }
    return result;
}

ModelResult ModelStore::performDownload(const ModelDescriptor& descriptor,
                                        const DownloadProgressCallback& progress) {
    const QString name = descriptor.name();
    const QString finalPath = descriptor.localPath();
    const QString partialPath = finalPath + PartialSuffix;

    QString host;
    int timeoutMs = 0;
    {
        QMutexLocker locker(&d->mutex);
        host = d->downloadHost;
        timeoutMs = d->downloadTimeoutMs;
        ++d->downloadCount;
    }
    const QString url = descriptor.resolveUrl(host);

    if (!d->source) {
        return fail(descriptor, ModelError::DownloadFailed, "No model source configured");
    }

    QDir targetDir = QFileInfo(finalPath).absoluteDir();
    if (!targetDir.exists() && !targetDir.mkpath(".")) {
        return fail(descriptor, ModelError::Io,
                    QString("Cannot create model directory %1").arg(targetDir.absolutePath()));
    }

    QFile partial(partialPath);
    if (!partial.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(descriptor, ModelError::Io,
                    QString("Cannot open %1 for writing: %2").arg(partialPath, partial.errorString()));
    }

    WHISPERKIT_INFO("Downloading model '{}' from {}", name.toStdString(), url.toStdString());
    setState(name, DownloadState::downloading(0, -1));
    emit downloadStarted(name, url);

    qint64 received = 0;
    qint64 total = -1;
    std::optional<ModelStoreError> stopReason;
    QElapsedTimer elapsed;
    elapsed.start();

    FetchCallbacks callbacks;
    callbacks.onResponse = [&total](qint64 contentLength) {
        total = contentLength;
    };
    callbacks.onChunk = [&](const QByteArray& chunk) -> bool {
        if (partial.write(chunk) != chunk.size()) {
            stopReason = ModelStoreError{ModelError::Io,
                                         QString("Write to %1 failed: %2").arg(partialPath, partial.errorString())};
            return false;
        }
        received += chunk.size();

        setState(name, DownloadState::downloading(received, total));
        if (progress) {
            progress(received, total);
        }
        emit downloadProgress(name, received, total);

        if (timeoutMs > 0 && elapsed.elapsed() > timeoutMs) {
            stopReason = ModelStoreError{ModelError::DownloadFailed,
                                         QString("Download timed out after %1 ms").arg(timeoutMs)};
            return false;
        }
        return true;
    };

    auto fetched = d->source->fetch(url, callbacks);

    const bool flushed = partial.flush();
    partial.close();

    if (stopReason) {
        return fail(descriptor, stopReason->code, stopReason->reason, partialPath);
    }
    if (fetched.hasError()) {
        return fail(descriptor, ModelError::DownloadFailed, fetched.error().reason, partialPath);
    }
    if (!flushed) {
        return fail(descriptor, ModelError::Io,
                    QString("Flush of %1 failed: %2").arg(partialPath, partial.errorString()), partialPath);
    }
    if (total >= 0 && received != total) {
        return fail(descriptor, ModelError::CorruptDownload,
                    QString("Received %1 of %2 announced bytes").arg(received).arg(total), partialPath);
    }

    auto verified = verifyFile(partialPath, descriptor.expectedSize());
    if (verified.hasError()) {
        return fail(descriptor, ModelError::CorruptDownload, verified.error().reason, partialPath);
    }

    if (QFile::exists(finalPath) && !QFile::remove(finalPath)) {
        return fail(descriptor, ModelError::Io, QString("Cannot replace existing %1").arg(finalPath), partialPath);
    }
    if (!QFile::rename(partialPath, finalPath)) {
        return fail(descriptor, ModelError::Io,
                    QString("Cannot move %1 to %2").arg(partialPath, finalPath), partialPath);
    }

    WHISPERKIT_INFO("Model '{}' ready at {} ({} bytes, {} ms)",
                    name.toStdString(), finalPath.toStdString(), received, elapsed.elapsed());
    setState(name, DownloadState::completed(received));
    emit downloadCompleted(name, finalPath);
    return finalPath;
}

Expected<void, ModelStoreError> ModelStore::verifyFile(const QString& path, qint64 expectedSize) const {
    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return makeUnexpected(ModelStoreError{ModelError::Io, QString("%1 does not exist").arg(path)});
    }

    if (expectedSize > 0 && info.size() != expectedSize) {
        return makeUnexpected(ModelStoreError{ModelError::CorruptDownload,
                                              QString("Size mismatch: expected %1 bytes, found %2")
                                                  .arg(expectedSize).arg(info.size())});
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return makeUnexpected(ModelStoreError{ModelError::Io,
                                              QString("Cannot read %1: %2").arg(path, file.errorString())});
    }
    const QByteArray header = file.read(4);
    file.close();

    QList<QByteArray> signatures;
    {
        QMutexLocker locker(&d->mutex);
        signatures = d->signatures;
    }

    for (const QByteArray& signature : signatures) {
        if (header.startsWith(signature) && header.size() >= signature.size()) {
            return Expected<void, ModelStoreError>();
        }
    }

    return makeUnexpected(ModelStoreError{ModelError::CorruptDownload,
                                          QString("Unrecognized model format header '%1'")
                                              .arg(QString::fromLatin1(header.toHex()))});
}

ModelResult ModelStore::fail(const ModelDescriptor& descriptor, ModelError code,
                             const QString& reason, const QString& partialPath) {
    if (!partialPath.isEmpty() && QFile::exists(partialPath) && !QFile::remove(partialPath)) {
        WHISPERKIT_WARN("Could not delete partial download {}", partialPath.toStdString());
    }

    WHISPERKIT_ERROR("Model '{}': {}: {}", descriptor.name().toStdString(),
                     errorToString(code).toStdString(), reason.toStdString());
    setState(descriptor.name(), DownloadState::failed(reason));
    emit downloadFailed(descriptor.name(), reason);
    return makeUnexpected(ModelStoreError{code, reason});
}

bool ModelStore::isAvailable(const ModelDescriptor& descriptor) const {
    return descriptor.isValid() && verifyFile(descriptor.localPath(), descriptor.expectedSize()).hasValue();
}

Expected<void, ModelStoreError> ModelStore::remove(const ModelDescriptor& descriptor) {
    {
        QMutexLocker locker(&d->mutex);
        if (d->inFlight.contains(descriptor.name())) {
            return makeUnexpected(ModelStoreError{ModelError::Io,
                                                  QString("Model '%1' is being downloaded").arg(descriptor.name())});
        }
    }

    const QString path = descriptor.localPath();
    if (QFile::exists(path) && !QFile::remove(path)) {
        return makeUnexpected(ModelStoreError{ModelError::Io, QString("Cannot delete %1").arg(path)});
    }

    setState(descriptor.name(), DownloadState::idle());
    WHISPERKIT_INFO("Removed model '{}'", descriptor.name().toStdString());
    return Expected<void, ModelStoreError>();
}

DownloadState ModelStore::downloadState(const QString& modelName) const {
    QMutexLocker locker(&d->mutex);
    return d->states.value(modelName, DownloadState::idle());
}

void ModelStore::setDownloadHost(const QString& host) {
    QMutexLocker locker(&d->mutex);
    d->downloadHost = host.isEmpty() ? DefaultDownloadHost : host;
}

QString ModelStore::downloadHost() const {
    QMutexLocker locker(&d->mutex);
    return d->downloadHost;
}

void ModelStore::setDownloadTimeout(int timeoutMs) {
    QMutexLocker locker(&d->mutex);
    d->downloadTimeoutMs = qMax(0, timeoutMs);
}

int ModelStore::downloadTimeout() const {
    QMutexLocker locker(&d->mutex);
    return d->downloadTimeoutMs;
}

void ModelStore::setAcceptedSignatures(const QList<QByteArray>& signatures) {
    QMutexLocker locker(&d->mutex);
    d->signatures = signatures;
}

QList<QByteArray> ModelStore::acceptedSignatures() const {
    QMutexLocker locker(&d->mutex);
    return d->signatures;
}

int ModelStore::downloadCount() const {
    QMutexLocker locker(&d->mutex);
    return d->downloadCount;
}

void ModelStore::setState(const QString& modelName, const DownloadState& state) {
    QMutexLocker locker(&d->mutex);
    d->states.insert(modelName, state);
}

} // namespace WhisperKit
