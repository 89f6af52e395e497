#include "JobQueue.hpp"
#include "core/common/Logger.hpp"
#include "core/transcription/Fingerprint.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QElapsedTimer>
#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QThreadPool>
#include <QtCore/QWaitCondition>
#include <set>

namespace WhisperKit {

namespace {

struct QueueItem {
    JobId id = 0;
    TranscriptionRequest request;
    Priority priority = Priority::Normal;
    QDateTime enqueuedAt;
    quint64 sequence = 0;
    JobStatus status = JobStatus::Pending;
    QString fingerprint;
    bool waitingOnLeader = false;
    QElapsedTimer timer;
};

// Highest priority first, then earliest arrival
struct PendingKey {
    int priority = 0;
    quint64 sequence = 0;
    JobId id = 0;

    bool operator<(const PendingKey& other) const {
        if (priority != other.priority) {
            return priority > other.priority;
        }
        return sequence < other.sequence;
    }
};

PendingKey keyFor(const QueueItem& item) {
    return PendingKey{static_cast<int>(item.priority), item.sequence, item.id};
}

} // namespace

QString jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return QStringLiteral("pending");
        case JobStatus::Processing: return QStringLiteral("processing");
        case JobStatus::Completed: return QStringLiteral("completed");
        case JobStatus::Failed: return QStringLiteral("failed");
        case JobStatus::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

bool isTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Cancelled;
}

QString errorToString(QueueError error) {
    switch (error) {
        case QueueError::NotFound: return QStringLiteral("Job not found");
        case QueueError::InvalidState: return QStringLiteral("Job is no longer pending");
    }
    return QStringLiteral("Queue error");
}

JobError JobError::fromModelError(const ModelStoreError& error) {
    return JobError{error, QString("%1: %2").arg(errorToString(error.code), error.reason)};
}

JobError JobError::fromEngineFailure(const EngineFailure& error) {
    return JobError{error, QString("%1: %2").arg(errorToString(error.code), error.reason)};
}

class JobQueue::JobQueuePrivate {
public:
    std::shared_ptr<ModelCatalog> catalog;
    std::shared_ptr<ModelStore> modelStore;
    std::shared_ptr<TranscriptionEngine> engine;
    std::shared_ptr<ResultCache> cache;
    JobQueueOptions options;

    mutable QMutex mutex;
    QWaitCondition idleCondition;
    QHash<JobId, QueueItem> items;
    std::set<PendingKey> pending;
    QHash<QString, JobId> leaders;
    QHash<QString, QList<JobId>> followers;
    QHash<JobId, JobResult> results;
    QList<JobId> resultOrder;

    JobId nextId = 1;
    quint64 nextSequence = 0;
    int active = 0;
    int waiting = 0;
    bool paused = false;
    bool shuttingDown = false;

    QThreadPool pool;

    bool idleLocked() const {
        return pending.empty() && active == 0 && waiting == 0;
    }
};

JobQueue::JobQueue(std::shared_ptr<ModelCatalog> catalog,
                   std::shared_ptr<ModelStore> modelStore,
                   std::shared_ptr<TranscriptionEngine> engine,
                   std::shared_ptr<ResultCache> cache,
                   JobQueueOptions options,
                   QObject* parent)
    : QObject(parent)
    , d(std::make_unique<JobQueuePrivate>()) {
    qRegisterMetaType<WhisperKit::JobStatus>();
    qRegisterMetaType<WhisperKit::TranscriptionResult>();

    d->catalog = std::move(catalog);
    d->modelStore = std::move(modelStore);
    d->engine = std::move(engine);
    d->cache = std::move(cache);
    d->options = options;
    d->options.maxConcurrent = qMax(1, d->options.maxConcurrent);
    d->options.maxRetainedResults = qMax(0, d->options.maxRetainedResults);
    d->pool.setMaxThreadCount(d->options.maxConcurrent);

    WHISPERKIT_INFO("JobQueue ready (max {} concurrent jobs)", d->options.maxConcurrent);
}

JobQueue::~JobQueue() {
    {
        QMutexLocker locker(&d->mutex);
        d->shuttingDown = true;
    }
    d->pool.waitForDone();
}

JobId JobQueue::enqueue(const TranscriptionRequest& request) {
    return enqueue(request, request.priority);
}

JobId JobQueue::enqueue(const TranscriptionRequest& request, Priority priority) {
    QueueItem item;
    item.request = request;
    item.request.priority = priority;
    item.priority = priority;
    item.enqueuedAt = QDateTime::currentDateTimeUtc();

    JobId id = 0;
    {
        QMutexLocker locker(&d->mutex);
        id = d->nextId++;
        item.id = id;
        item.sequence = d->nextSequence++;
        d->pending.insert(keyFor(item));
        d->items.insert(id, item);
        postStatusChanged(id, JobStatus::Pending);
        scheduleLocked();
    }

    WHISPERKIT_DEBUG("Job {} queued: {} ({}, {})", id, request.audioPath.toStdString(),
                     request.modelName.toStdString(), priorityToString(priority).toStdString());
    return id;
}

Expected<void, QueueError> JobQueue::tryCancel(JobId id) {
    bool becameIdle = false;
    {
        QMutexLocker locker(&d->mutex);
        auto it = d->items.find(id);
        if (it == d->items.end()) {
            return makeUnexpected(d->results.contains(id) ? QueueError::InvalidState : QueueError::NotFound);
        }
        if (it->status != JobStatus::Pending) {
            return makeUnexpected(QueueError::InvalidState);
        }

        d->pending.erase(keyFor(*it));
        JobResult cancelled;
        cancelled.id = id;
        cancelled.status = JobStatus::Cancelled;
        d->items.erase(it);
        retainResultLocked(cancelled);

        becameIdle = d->idleLocked();
        if (becameIdle) {
            d->idleCondition.wakeAll();
        }
    }

    WHISPERKIT_DEBUG("Job {} cancelled", id);
    postStatusChanged(id, JobStatus::Cancelled);
    return Expected<void, QueueError>();
}

bool JobQueue::cancel(JobId id) {
    return tryCancel(id).hasValue();
}

int JobQueue::clearPending() {
    QList<JobId> ids;
    {
        QMutexLocker locker(&d->mutex);
        for (const PendingKey& key : d->pending) {
            ids.append(key.id);
        }
    }

    int cancelled = 0;
    for (JobId id : ids) {
        if (tryCancel(id).hasValue()) {
            ++cancelled;
        }
    }
    WHISPERKIT_INFO("Cleared {} pending jobs", cancelled);
    return cancelled;
}

void JobQueue::pause() {
    QMutexLocker locker(&d->mutex);
    d->paused = true;
    WHISPERKIT_INFO("JobQueue paused");
}

void JobQueue::resume() {
    QMutexLocker locker(&d->mutex);
    d->paused = false;
    WHISPERKIT_INFO("JobQueue resumed");
    scheduleLocked();
}

bool JobQueue::isPaused() const {
    QMutexLocker locker(&d->mutex);
    return d->paused;
}

std::optional<JobStatus> JobQueue::status(JobId id) const {
    QMutexLocker locker(&d->mutex);
    auto it = d->items.constFind(id);
    if (it != d->items.constEnd()) {
        return it->status;
    }
    auto resultIt = d->results.constFind(id);
    if (resultIt != d->results.constEnd()) {
        return resultIt->status;
    }
    return std::nullopt;
}

std::optional<JobResult> JobQueue::result(JobId id) const {
    QMutexLocker locker(&d->mutex);
    auto it = d->results.constFind(id);
    if (it == d->results.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool JobQueue::purgeResult(JobId id) {
    QMutexLocker locker(&d->mutex);
    d->resultOrder.removeOne(id);
    return d->results.remove(id) > 0;
}

void JobQueue::clearResults() {
    QMutexLocker locker(&d->mutex);
    d->results.clear();
    d->resultOrder.clear();
}

int JobQueue::pendingCount() const {
    QMutexLocker locker(&d->mutex);
    return static_cast<int>(d->pending.size());
}

int JobQueue::activeCount() const {
    QMutexLocker locker(&d->mutex);
    return d->active;
}

int JobQueue::retainedResultCount() const {
    QMutexLocker locker(&d->mutex);
    return d->results.size();
}

bool JobQueue::isIdle() const {
    QMutexLocker locker(&d->mutex);
    return d->idleLocked();
}

int JobQueue::maxConcurrent() const {
    return d->options.maxConcurrent;
}

bool JobQueue::waitForIdle(int timeoutMs) {
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever) : QDeadlineTimer(timeoutMs);
    QMutexLocker locker(&d->mutex);
    while (!d->idleLocked()) {
        if (!d->idleCondition.wait(&d->mutex, deadline)) {
            return d->idleLocked();
        }
    }
    return true;
}

void JobQueue::scheduleLocked() {
    while (!d->paused && !d->shuttingDown && d->active < d->options.maxConcurrent && !d->pending.empty()) {
        const PendingKey next = *d->pending.begin();
        d->pending.erase(d->pending.begin());

        auto it = d->items.find(next.id);
        if (it == d->items.end()) {
            continue;
        }
        it->status = JobStatus::Processing;
        it->timer.start();
        ++d->active;
        postStatusChanged(next.id, JobStatus::Processing);

        const JobId id = next.id;
        d->pool.start([this, id]() { runPipeline(id); });
    }
}

void JobQueue::runPipeline(JobId id) {
    TranscriptionRequest request;
    {
        QMutexLocker locker(&d->mutex);
        auto it = d->items.constFind(id);
        if (it == d->items.constEnd()) {
            --d->active;
            scheduleLocked();
            return;
        }
        request = it->request;
    }

    auto fingerprint = Fingerprint::compute(request);
    if (fingerprint.hasError()) {
        finishJob(id, JobStatus::Failed, std::nullopt, JobError::fromEngineFailure(fingerprint.error()), false, true);
        return;
    }
    const QString key = fingerprint.value();

    {
        QMutexLocker locker(&d->mutex);
        d->items[id].fingerprint = key;
    }

    if (d->cache) {
        if (auto hit = d->cache->lookup(key)) {
            WHISPERKIT_DEBUG("Job {} served from cache", id);
            finishJob(id, JobStatus::Completed, hit->result, std::nullopt, true, true);
            return;
        }
    }

    {
        QMutexLocker locker(&d->mutex);
        if (d->leaders.contains(key)) {
            // Identical request already decoding; wait for it without holding a worker
            d->followers[key].append(id);
            d->items[id].waitingOnLeader = true;
            --d->active;
            ++d->waiting;
            WHISPERKIT_DEBUG("Job {} waits on job {} for the same audio", id, d->leaders.value(key));
            scheduleLocked();
            return;
        }
        d->leaders.insert(key, id);
    }

    // A leader that finished just before we registered has already stored its result
    if (d->cache) {
        if (auto hit = d->cache->lookup(key)) {
            resolveFollowers(key, hit->result, std::nullopt);
            finishJob(id, JobStatus::Completed, hit->result, std::nullopt, true, true);
            return;
        }
    }

    auto fail = [this, id, &key](const JobError& error) {
        WHISPERKIT_ERROR("Job {} failed: {}", id, error.reason.toStdString());
        resolveFollowers(key, std::nullopt, error);
        finishJob(id, JobStatus::Failed, std::nullopt, error, false, true);
    };

    std::optional<ModelDescriptor> descriptor = d->catalog ? d->catalog->find(request.modelName) : std::nullopt;
    if (!descriptor) {
        fail(JobError::fromModelError(ModelStoreError{ModelError::UnknownModel,
                                                      QString("No model named '%1'").arg(request.modelName)}));
        return;
    }

    auto modelPath = d->modelStore->ensureAvailable(*descriptor, [this, id](qint64 received, qint64 total) {
        postDownloadProgress(id, received, total);
    });
    if (modelPath.hasError()) {
        fail(JobError::fromModelError(modelPath.error()));
        return;
    }

    auto transcription = d->engine->transcribe(request, modelPath.value());
    if (transcription.hasError()) {
        fail(JobError::fromEngineFailure(transcription.error()));
        return;
    }

    if (d->cache) {
        CacheEntry entry;
        entry.fingerprint = key;
        entry.result = transcription.value();
        entry.modelName = request.modelName;
        entry.language = transcription.value().language;
        entry.audioPath = request.audioPath;
        d->cache->store(std::move(entry));
    }

    resolveFollowers(key, transcription.value(), std::nullopt);
    finishJob(id, JobStatus::Completed, transcription.value(), std::nullopt, false, true);
}

void JobQueue::resolveFollowers(const QString& fingerprint, const std::optional<TranscriptionResult>& result,
                                const std::optional<JobError>& error) {
    QList<JobId> waitingJobs;
    {
        QMutexLocker locker(&d->mutex);
        waitingJobs = d->followers.take(fingerprint);
        d->leaders.remove(fingerprint);
    }

    const JobStatus status = result ? JobStatus::Completed : JobStatus::Failed;
    for (JobId follower : waitingJobs) {
        finishJob(follower, status, result, error, false, false);
    }
}

void JobQueue::finishJob(JobId id, JobStatus status, const std::optional<TranscriptionResult>& result,
                         const std::optional<JobError>& error, bool fromCache, bool ownsWorker) {
    bool becameIdle = false;
    {
        QMutexLocker locker(&d->mutex);
        auto it = d->items.find(id);
        if (it == d->items.end()) {
            return;
        }

        JobResult jobResult;
        jobResult.id = id;
        jobResult.status = status;
        jobResult.result = result;
        jobResult.error = error;
        jobResult.fromCache = fromCache;
        jobResult.fingerprint = it->fingerprint;
        jobResult.processingTimeMs = it->timer.isValid() ? it->timer.elapsed() : 0;

        if (it->waitingOnLeader) {
            --d->waiting;
        }
        d->items.erase(it);
        retainResultLocked(jobResult);

        if (ownsWorker) {
            --d->active;
        }
        scheduleLocked();

        becameIdle = d->idleLocked();
        if (becameIdle) {
            d->idleCondition.wakeAll();
        }
    }

    postStatusChanged(id, status);
    if (status == JobStatus::Completed && result) {
        postCompleted(id, *result);
    } else if (status == JobStatus::Failed) {
        postFailed(id, error ? error->reason : QStringLiteral("Unknown failure"));
    }
    if (becameIdle) {
        postQueueEmpty();
    }
}

void JobQueue::retainResultLocked(const JobResult& jobResult) {
    if (d->options.maxRetainedResults == 0) {
        return;
    }
    d->results.insert(jobResult.id, jobResult);
    d->resultOrder.append(jobResult.id);
    while (d->resultOrder.size() > d->options.maxRetainedResults) {
        d->results.remove(d->resultOrder.takeFirst());
    }
}

void JobQueue::postStatusChanged(JobId id, JobStatus status) {
    QMetaObject::invokeMethod(this, [this, id, status]() {
        emit jobStatusChanged(id, status);
    }, Qt::QueuedConnection);
}

void JobQueue::postCompleted(JobId id, const TranscriptionResult& result) {
    QMetaObject::invokeMethod(this, [this, id, result]() {
        emit jobCompleted(id, result);
    }, Qt::QueuedConnection);
}

void JobQueue::postFailed(JobId id, const QString& reason) {
    QMetaObject::invokeMethod(this, [this, id, reason]() {
        emit jobFailed(id, reason);
    }, Qt::QueuedConnection);
}

void JobQueue::postDownloadProgress(JobId id, qint64 bytesReceived, qint64 bytesTotal) {
    QMetaObject::invokeMethod(this, [this, id, bytesReceived, bytesTotal]() {
        emit jobDownloadProgress(id, bytesReceived, bytesTotal);
    }, Qt::QueuedConnection);
}

void JobQueue::postQueueEmpty() {
    QMetaObject::invokeMethod(this, [this]() {
        emit queueEmpty();
    }, Qt::QueuedConnection);
}

} // namespace WhisperKit
