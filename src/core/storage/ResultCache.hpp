#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <functional>
#include <memory>
#include <optional>

#include "core/common/Expected.hpp"
#include "core/transcription/TranscriptionTypes.hpp"

namespace WhisperKit {

enum class CacheError {
    Io,
    Corrupt
};

QString errorToString(CacheError error);

struct CacheEntry {
    QString fingerprint;
    TranscriptionResult result;
    QDateTime createdAt;
    QString modelName;
    QString language;
    QString audioPath;

    QJsonObject toJson() const;
    static Expected<CacheEntry, CacheError> fromJson(const QJsonObject& json);
};

struct CacheStats {
    qint64 hits = 0;
    qint64 misses = 0;
    qint64 evictions = 0;
    qint64 expirations = 0;
    int entryCount = 0;
};

struct CacheOptions {
    qint64 maxAgeMs = qint64(7) * 24 * 60 * 60 * 1000;
    int maxEntries = 100;
    QString persistencePath; // empty = memory only
};

/**
 * @brief Fingerprint-keyed store of earlier transcription results.
 *
 * Expired entries are dropped when looked up. When the entry count goes over
 * maxEntries the entries with the oldest createdAt are evicted. Disk problems
 * never reach the caller; they are logged and the cache behaves as a miss.
 *
 * Thread-safe.
 */
class ResultCache {
public:
    using Clock = std::function<QDateTime()>;

    explicit ResultCache(CacheOptions options = {}, Clock clock = {});
    ~ResultCache();

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // Loads persisted entries, discarding unreadable ones; returns the number loaded
    Expected<int, CacheError> initialize();

    std::optional<CacheEntry> lookup(const QString& fingerprint);
    void store(CacheEntry entry);
    bool invalidate(const QString& fingerprint);
    void clear();

    int size() const;
    CacheStats stats() const;

    void setMaxAge(qint64 maxAgeMs);
    void setMaxEntries(int maxEntries);
    CacheOptions options() const;

    static QString fileNameFor(const QString& fingerprint);

private:
    class ResultCachePrivate;
    std::unique_ptr<ResultCachePrivate> d;

    void evictOverflowLocked();
    void removeLocked(const QString& fingerprint);
    Expected<void, CacheError> persistLocked(const CacheEntry& entry);
    void unpersistLocked(const QString& fingerprint);
    QDateTime now() const;
};

} // namespace WhisperKit
