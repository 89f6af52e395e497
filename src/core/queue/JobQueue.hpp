#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMetaType>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>
#include <optional>
#include <variant>

#include "core/common/Expected.hpp"
#include "core/storage/ResultCache.hpp"
#include "core/transcription/ModelCatalog.hpp"
#include "core/transcription/ModelStore.hpp"
#include "core/transcription/TranscriptionEngine.hpp"
#include "core/transcription/TranscriptionTypes.hpp"

namespace WhisperKit {

using JobId = quint64;

enum class JobStatus {
    Pending,
    Processing,
    Completed,
    Failed,
    Cancelled
};

QString jobStatusToString(JobStatus status);
bool isTerminal(JobStatus status);

enum class QueueError {
    NotFound,
    InvalidState
};

QString errorToString(QueueError error);

// The stage error that ended a job, plus a reason suitable for display
struct JobError {
    std::variant<ModelStoreError, EngineFailure> cause;
    QString reason;

    static JobError fromModelError(const ModelStoreError& error);
    static JobError fromEngineFailure(const EngineFailure& error);
};

struct JobResult {
    JobId id = 0;
    JobStatus status = JobStatus::Pending;
    std::optional<TranscriptionResult> result;
    std::optional<JobError> error;
    qint64 processingTimeMs = 0;
    bool fromCache = false;
    QString fingerprint;
};

struct JobQueueOptions {
    int maxConcurrent = 2;
    int maxRetainedResults = 256;
};

/**
 * @brief Priority scheduler driving requests through cache, model store and engine.
 *
 * Pending jobs are ordered by priority, then by arrival. Up to maxConcurrent
 * pipelines run at once on the queue's own thread pool. A job whose
 * fingerprint is already being decoded waits for that decode instead of
 * starting another one; it stays Processing without occupying a worker.
 *
 * Only Pending jobs can be cancelled. Signals are queued to the thread that
 * owns the JobQueue and never block a pipeline.
 */
class JobQueue : public QObject {
    Q_OBJECT

public:
    JobQueue(std::shared_ptr<ModelCatalog> catalog,
             std::shared_ptr<ModelStore> modelStore,
             std::shared_ptr<TranscriptionEngine> engine,
             std::shared_ptr<ResultCache> cache,
             JobQueueOptions options = {},
             QObject* parent = nullptr);
    ~JobQueue() override;

    JobId enqueue(const TranscriptionRequest& request);
    JobId enqueue(const TranscriptionRequest& request, Priority priority);

    Expected<void, QueueError> tryCancel(JobId id);
    bool cancel(JobId id);
    // Cancels every Pending job; returns how many were cancelled
    int clearPending();

    void pause();
    void resume();
    bool isPaused() const;

    std::optional<JobStatus> status(JobId id) const;
    std::optional<JobResult> result(JobId id) const;
    bool purgeResult(JobId id);
    void clearResults();

    int pendingCount() const;
    int activeCount() const;
    int retainedResultCount() const;
    bool isIdle() const;
    int maxConcurrent() const;

    // Blocks until no job is running or pending, or the timeout expires
    bool waitForIdle(int timeoutMs = -1);

signals:
    void jobStatusChanged(WhisperKit::JobId id, WhisperKit::JobStatus status);
    void jobCompleted(WhisperKit::JobId id, const WhisperKit::TranscriptionResult& result);
    void jobFailed(WhisperKit::JobId id, const QString& reason);
    void jobDownloadProgress(WhisperKit::JobId id, qint64 bytesReceived, qint64 bytesTotal);
    void queueEmpty();

private:
    class JobQueuePrivate;
    std::unique_ptr<JobQueuePrivate> d;

    void scheduleLocked();
    void runPipeline(JobId id);
    void finishJob(JobId id, JobStatus status, const std::optional<TranscriptionResult>& result,
                   const std::optional<JobError>& error, bool fromCache, bool ownsWorker);
    void resolveFollowers(const QString& fingerprint, const std::optional<TranscriptionResult>& result,
                          const std::optional<JobError>& error);
    void retainResultLocked(const JobResult& jobResult);

    void postStatusChanged(JobId id, JobStatus status);
    void postCompleted(JobId id, const TranscriptionResult& result);
    void postFailed(JobId id, const QString& reason);
    void postDownloadProgress(JobId id, qint64 bytesReceived, qint64 bytesTotal);
    void postQueueEmpty();
};

} // namespace WhisperKit

Q_DECLARE_METATYPE(WhisperKit::JobStatus)
