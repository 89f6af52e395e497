#include "ResultCache.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QHash>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QRegularExpression>
#include <QtCore/QSaveFile>

namespace WhisperKit {

namespace {

const QString FilePrefix = QStringLiteral("cache_");
const QString FileSuffix = QStringLiteral(".json");

bool isSafeKey(const QString& fingerprint) {
    static const QRegularExpression pattern(QStringLiteral("^[A-Za-z0-9_-]{1,128}$"));
    return pattern.match(fingerprint).hasMatch();
}

QJsonObject resultToJson(const TranscriptionResult& result) {
    QJsonArray segments;
    for (const Segment& segment : result.segments) {
        QJsonObject object;
        object["startMs"] = segment.startMs;
        object["endMs"] = segment.endMs;
        object["text"] = segment.text;
        segments.append(object);
    }

    QJsonObject json;
    json["text"] = result.text;
    json["segments"] = segments;
    json["processingTimeMs"] = result.processingTimeMs;
    json["language"] = result.language;
    json["conversionFallback"] = result.conversionFallback;
    return json;
}

TranscriptionResult resultFromJson(const QJsonObject& json) {
    TranscriptionResult result;
    result.text = json.value("text").toString();
    result.processingTimeMs = json.value("processingTimeMs").toInteger();
    result.language = json.value("language").toString();
    result.conversionFallback = json.value("conversionFallback").toBool();
    for (const QJsonValue& value : json.value("segments").toArray()) {
        const QJsonObject object = value.toObject();
        Segment segment;
        segment.startMs = object.value("startMs").toInteger();
        segment.endMs = object.value("endMs").toInteger();
        segment.text = object.value("text").toString();
        result.segments.append(segment);
    }
    return result;
}

} // namespace

QString errorToString(CacheError error) {
    switch (error) {
        case CacheError::Io: return QStringLiteral("Cache I/O error");
        case CacheError::Corrupt: return QStringLiteral("Corrupt cache entry");
    }
    return QStringLiteral("Cache error");
}

QJsonObject CacheEntry::toJson() const {
    QJsonObject json;
    json["fingerprint"] = fingerprint;
    json["createdAt"] = createdAt.toUTC().toString(Qt::ISODateWithMs);
    json["modelName"] = modelName;
    json["language"] = language;
    json["audioPath"] = audioPath;
    json["result"] = resultToJson(result);
    return json;
}

Expected<CacheEntry, CacheError> CacheEntry::fromJson(const QJsonObject& json) {
    CacheEntry entry;
    entry.fingerprint = json.value("fingerprint").toString();
    entry.createdAt = QDateTime::fromString(json.value("createdAt").toString(), Qt::ISODateWithMs);
    if (entry.fingerprint.isEmpty() || !entry.createdAt.isValid() || !json.value("result").isObject()) {
        return makeUnexpected(CacheError::Corrupt);
    }
    entry.modelName = json.value("modelName").toString();
    entry.language = json.value("language").toString();
    entry.audioPath = json.value("audioPath").toString();
    entry.result = resultFromJson(json.value("result").toObject());
    return entry;
}

class ResultCache::ResultCachePrivate {
public:
    CacheOptions options;
    Clock clock;

    mutable QMutex mutex;
    QHash<QString, CacheEntry> entries;
    QHash<QString, quint64> insertionOrder;
    quint64 nextSequence = 0;
    CacheStats stats;
};

ResultCache::ResultCache(CacheOptions options, Clock clock)
    : d(std::make_unique<ResultCachePrivate>()) {
    d->options = std::move(options);
    d->options.maxEntries = qMax(1, d->options.maxEntries);
    d->clock = clock ? std::move(clock) : Clock([]() { return QDateTime::currentDateTimeUtc(); });
}

ResultCache::~ResultCache() = default;

QString ResultCache::fileNameFor(const QString& fingerprint) {
    return FilePrefix + fingerprint + FileSuffix;
}

QDateTime ResultCache::now() const {
    return d->clock();
}

Expected<int, CacheError> ResultCache::initialize() {
    QMutexLocker locker(&d->mutex);
    if (d->options.persistencePath.isEmpty()) {
        return 0;
    }

    QDir dir(d->options.persistencePath);
    if (!dir.exists() && !dir.mkpath(".")) {
        WHISPERKIT_ERROR("Cannot create cache directory {}", d->options.persistencePath.toStdString());
        return makeUnexpected(CacheError::Io);
    }

    int loaded = 0;
    const QStringList files = dir.entryList({FilePrefix + "*" + FileSuffix}, QDir::Files);
    for (const QString& name : files) {
        const QString path = dir.filePath(name);
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            WHISPERKIT_WARN("Cannot read cache file {}: {}", path.toStdString(), file.errorString().toStdString());
            continue;
        }

        QJsonParseError parseError;
        const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
        file.close();

        auto entry = document.isObject() ? CacheEntry::fromJson(document.object())
                                         : Expected<CacheEntry, CacheError>(makeUnexpected(CacheError::Corrupt));
        if (entry.hasError() || fileNameFor(entry.value().fingerprint) != name) {
            WHISPERKIT_WARN("Discarding corrupt cache file {}", path.toStdString());
            if (!QFile::remove(path)) {
                WHISPERKIT_WARN("Could not delete {}", path.toStdString());
            }
            continue;
        }

        const QString fingerprint = entry.value().fingerprint;
        d->entries.insert(fingerprint, std::move(entry).value());
        d->insertionOrder.insert(fingerprint, d->nextSequence++);
        ++loaded;
    }

    evictOverflowLocked();
    WHISPERKIT_INFO("Result cache loaded {} entries from {}", loaded, d->options.persistencePath.toStdString());
    return loaded;
}

std::optional<CacheEntry> ResultCache::lookup(const QString& fingerprint) {
    QMutexLocker locker(&d->mutex);
    auto it = d->entries.constFind(fingerprint);
    if (it == d->entries.constEnd()) {
        ++d->stats.misses;
        return std::nullopt;
    }

    if (it->createdAt.msecsTo(now()) > d->options.maxAgeMs) {
        WHISPERKIT_DEBUG("Cache entry {} expired", fingerprint.toStdString());
        removeLocked(fingerprint);
        ++d->stats.expirations;
        ++d->stats.misses;
        return std::nullopt;
    }

    ++d->stats.hits;
    return it.value();
}

void ResultCache::store(CacheEntry entry) {
    if (entry.fingerprint.isEmpty()) {
        WHISPERKIT_WARN("Ignoring cache entry without fingerprint");
        return;
    }

    QMutexLocker locker(&d->mutex);
    if (!entry.createdAt.isValid()) {
        entry.createdAt = now();
    }

    auto persisted = persistLocked(entry);
    if (persisted.hasError()) {
        WHISPERKIT_WARN("Cache entry {} kept in memory only: {}",
                        entry.fingerprint.toStdString(), errorToString(persisted.error()).toStdString());
    }

    const QString fingerprint = entry.fingerprint;
    d->entries.insert(fingerprint, std::move(entry));
    d->insertionOrder.insert(fingerprint, d->nextSequence++);
    evictOverflowLocked();
}

bool ResultCache::invalidate(const QString& fingerprint) {
    QMutexLocker locker(&d->mutex);
    if (!d->entries.contains(fingerprint)) {
        return false;
    }
    removeLocked(fingerprint);
    return true;
}

void ResultCache::clear() {
    QMutexLocker locker(&d->mutex);
    const QStringList keys = d->entries.keys();
    for (const QString& fingerprint : keys) {
        removeLocked(fingerprint);
    }
    WHISPERKIT_INFO("Result cache cleared ({} entries)", keys.size());
}

int ResultCache::size() const {
    QMutexLocker locker(&d->mutex);
    return d->entries.size();
}

CacheStats ResultCache::stats() const {
    QMutexLocker locker(&d->mutex);
    CacheStats stats = d->stats;
    stats.entryCount = d->entries.size();
    return stats;
}

void ResultCache::setMaxAge(qint64 maxAgeMs) {
    QMutexLocker locker(&d->mutex);
    d->options.maxAgeMs = maxAgeMs;
}

void ResultCache::setMaxEntries(int maxEntries) {
    QMutexLocker locker(&d->mutex);
    d->options.maxEntries = qMax(1, maxEntries);
    evictOverflowLocked();
}

CacheOptions ResultCache::options() const {
    QMutexLocker locker(&d->mutex);
    return d->options;
}

void ResultCache::evictOverflowLocked() {
    while (d->entries.size() > d->options.maxEntries) {
        auto oldest = d->entries.constBegin();
        for (auto it = d->entries.constBegin(); it != d->entries.constEnd(); ++it) {
            const bool older = it->createdAt < oldest->createdAt
                || (it->createdAt == oldest->createdAt
                    && d->insertionOrder.value(it.key()) < d->insertionOrder.value(oldest.key()));
            if (older) {
                oldest = it;
            }
        }
        const QString fingerprint = oldest.key();
        WHISPERKIT_DEBUG("Evicting cache entry {}", fingerprint.toStdString());
        removeLocked(fingerprint);
        ++d->stats.evictions;
    }
}

void ResultCache::removeLocked(const QString& fingerprint) {
    d->entries.remove(fingerprint);
    d->insertionOrder.remove(fingerprint);
    unpersistLocked(fingerprint);
}

Expected<void, CacheError> ResultCache::persistLocked(const CacheEntry& entry) {
    if (d->options.persistencePath.isEmpty()) {
        return Expected<void, CacheError>();
    }
    if (!isSafeKey(entry.fingerprint)) {
        return makeUnexpected(CacheError::Io);
    }

    QSaveFile file(QDir(d->options.persistencePath).filePath(fileNameFor(entry.fingerprint)));
    if (!file.open(QIODevice::WriteOnly)) {
        return makeUnexpected(CacheError::Io);
    }
    const QByteArray data = QJsonDocument(entry.toJson()).toJson(QJsonDocument::Compact);
    if (file.write(data) != data.size() || !file.commit()) {
        return makeUnexpected(CacheError::Io);
    }
    return Expected<void, CacheError>();
}

void ResultCache::unpersistLocked(const QString& fingerprint) {
    if (d->options.persistencePath.isEmpty() || !isSafeKey(fingerprint)) {
        return;
    }
    const QString path = QDir(d->options.persistencePath).filePath(fileNameFor(fingerprint));
    if (QFile::exists(path) && !QFile::remove(path)) {
        WHISPERKIT_WARN("Could not delete cache file {}", path.toStdString());
    }
}

} // namespace WhisperKit
