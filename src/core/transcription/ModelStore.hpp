#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <functional>
#include <memory>

#include "core/common/Expected.hpp"
#include "ModelSource.hpp"
#include "TranscriptionTypes.hpp"

namespace WhisperKit {

enum class ModelError {
    DownloadFailed,
    CorruptDownload,
    Io,
    UnknownModel
};

struct ModelStoreError {
    ModelError code = ModelError::DownloadFailed;
    QString reason;
};

QString errorToString(ModelError error);

using DownloadProgressCallback = std::function<void(qint64 bytesReceived, qint64 bytesTotal)>;

/**
 * @brief Makes sure a model's weight file is present and sane on local disk.
 *
 * Downloads stream into "<localPath>.part" and are renamed only after the size
 * and leading magic bytes check out, so a file under its final name is always
 * complete. Concurrent requests for the same model share one download and all
 * receive its outcome.
 *
 * Thread-safe. Network and disk work happen on the calling thread.
 */
class ModelStore : public QObject {
    Q_OBJECT

public:
    static const QString DefaultDownloadHost;
    static const QString PartialSuffix;

    explicit ModelStore(std::shared_ptr<ModelSource> source, QObject* parent = nullptr);
    ~ModelStore() override;

    // Returns the local path, downloading only when the file is missing or fails verification
    Expected<QString, ModelStoreError> ensureAvailable(const ModelDescriptor& descriptor,
                                                       const DownloadProgressCallback& progress = {});

    // Always fetches from the network, replacing any local copy on success
    Expected<QString, ModelStoreError> download(const ModelDescriptor& descriptor,
                                                const DownloadProgressCallback& progress = {});

    bool isAvailable(const ModelDescriptor& descriptor) const;
    Expected<void, ModelStoreError> remove(const ModelDescriptor& descriptor);

    DownloadState downloadState(const QString& modelName) const;

    void setDownloadHost(const QString& host);
    QString downloadHost() const;

    // 0 disables the limit
    void setDownloadTimeout(int timeoutMs);
    int downloadTimeout() const;

    void setAcceptedSignatures(const QList<QByteArray>& signatures);
    QList<QByteArray> acceptedSignatures() const;

    // Number of network transfers started since construction
    int downloadCount() const;

signals:
    void downloadStarted(const QString& modelName, const QString& url);
    void downloadProgress(const QString& modelName, qint64 bytesReceived, qint64 bytesTotal);
    void downloadCompleted(const QString& modelName, const QString& localPath);
    void downloadFailed(const QString& modelName, const QString& reason);

private:
    class ModelStorePrivate;
    std::unique_ptr<ModelStorePrivate> d;

    Expected<QString, ModelStoreError> acquire(const ModelDescriptor& descriptor,
                                               const DownloadProgressCallback& progress,
                                               bool reuseExisting);
    Expected<QString, ModelStoreError> performDownload(const ModelDescriptor& descriptor,
                                                       const DownloadProgressCallback& progress);
    Expected<void, ModelStoreError> verifyFile(const QString& path, qint64 expectedSize) const;
    Expected<QString, ModelStoreError> fail(const ModelDescriptor& descriptor, ModelError code,
                                            const QString& reason, const QString& partialPath = QString());
    void setState(const QString& modelName, const DownloadState& state);
};

} // namespace WhisperKit
