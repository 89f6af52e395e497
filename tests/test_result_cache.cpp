#include <QtTest/QtTest>
#include <QtCore/QDir>

#include "core/storage/ResultCache.hpp"
#include "utils/TestUtils.hpp"

using namespace WhisperKit;
using namespace WhisperKit::Test;

namespace {

CacheEntry makeEntry(const QString& fingerprint, const QString& text) {
    CacheEntry entry;
    entry.fingerprint = fingerprint;
    entry.modelName = "base";
    entry.language = "en";
    entry.audioPath = "/tmp/" + fingerprint + ".wav";
    entry.result.text = text;
    entry.result.language = "en";
    entry.result.segments.append(Segment{0, 1500, text});
    entry.result.processingTimeMs = 42;
    return entry;
}

} // namespace

class TestResultCache : public QObject {
    Q_OBJECT

private slots:
    void init() {
        now_ = QDateTime(QDate(2024, 3, 1), QTime(12, 0), Qt::UTC);
    }

    void testStoreAndLookup() {
        ResultCache cache({}, clock());
        cache.store(makeEntry("abc", "hello"));

        auto hit = cache.lookup("abc");
        QVERIFY(hit.has_value());
        QCOMPARE(hit->result.text, QString("hello"));
        QCOMPARE(hit->createdAt, now_);
        QVERIFY(!cache.lookup("missing").has_value());

        const CacheStats stats = cache.stats();
        QCOMPARE(stats.hits, qint64(1));
        QCOMPARE(stats.misses, qint64(1));
        QCOMPARE(stats.entryCount, 1);
    }

    void testExpiry() {
        CacheOptions options;
        options.maxAgeMs = 1000;
        ResultCache cache(options, clock());
        cache.store(makeEntry("abc", "hello"));

        now_ = now_.addMSecs(1000);
        QVERIFY(cache.lookup("abc").has_value());

        now_ = now_.addMSecs(1000);
        QVERIFY(!cache.lookup("abc").has_value());
        QCOMPARE(cache.size(), 0);
        QCOMPARE(cache.stats().expirations, qint64(1));
    }

    void testEvictsOldestOnOverflow() {
        CacheOptions options;
        options.maxEntries = 3;
        ResultCache cache(options, clock());

        for (int i = 0; i < 4; ++i) {
            cache.store(makeEntry(QString("fp%1").arg(i), QString("text %1").arg(i)));
            now_ = now_.addSecs(1);
        }

        QCOMPARE(cache.size(), 3);
        QVERIFY(!cache.lookup("fp0").has_value());
        QVERIFY(cache.lookup("fp1").has_value());
        QVERIFY(cache.lookup("fp2").has_value());
        QVERIFY(cache.lookup("fp3").has_value());
        QCOMPARE(cache.stats().evictions, qint64(1));
    }

    void testEvictionTieBreaksOnInsertionOrder() {
        CacheOptions options;
        options.maxEntries = 2;
        ResultCache cache(options, clock());

        cache.store(makeEntry("first", "a"));
        cache.store(makeEntry("second", "b"));
        cache.store(makeEntry("third", "c"));

        QVERIFY(!cache.lookup("first").has_value());
        QVERIFY(cache.lookup("second").has_value());
        QVERIFY(cache.lookup("third").has_value());
    }

    void testShrinkingMaxEntriesEvicts() {
        ResultCache cache({}, clock());
        for (int i = 0; i < 5; ++i) {
            cache.store(makeEntry(QString("fp%1").arg(i), "x"));
            now_ = now_.addSecs(1);
        }
        cache.setMaxEntries(2);
        QCOMPARE(cache.size(), 2);
        QVERIFY(cache.lookup("fp4").has_value());
    }

    void testZeroMaxEntriesKeepsOne() {
        CacheOptions options;
        options.maxEntries = 0;
        ResultCache cache(options, clock());
        cache.store(makeEntry("only", "kept"));
        QCOMPARE(cache.size(), 1);
        QVERIFY(cache.lookup("only").has_value());

        cache.store(makeEntry("newer", "kept"));
        QCOMPARE(cache.size(), 1);
        QVERIFY(cache.lookup("newer").has_value());
    }

    void testInvalidateAndClear() {
        ResultCache cache({}, clock());
        cache.store(makeEntry("a", "1"));
        cache.store(makeEntry("b", "2"));

        QVERIFY(cache.invalidate("a"));
        QVERIFY(!cache.invalidate("a"));
        QCOMPARE(cache.size(), 1);

        cache.clear();
        QCOMPARE(cache.size(), 0);
        QVERIFY(!cache.lookup("b").has_value());
    }

    void testPersistenceRoundTrip() {
        const QString directory = TestUtils::createTempDirectory("cache");
        CacheOptions options;
        options.persistencePath = directory;

        {
            ResultCache cache(options, clock());
            auto loaded = cache.initialize();
            ASSERT_EXPECTED_VALUE(loaded);
            QCOMPARE(loaded.value(), 0);
            cache.store(makeEntry("persisted", "kept across restarts"));
            ASSERT_FILE_EXISTS(QDir(directory).filePath(ResultCache::fileNameFor("persisted")));
        }

        ResultCache reopened(options, clock());
        auto loaded = reopened.initialize();
        ASSERT_EXPECTED_VALUE(loaded);
        QCOMPARE(loaded.value(), 1);

        auto hit = reopened.lookup("persisted");
        QVERIFY(hit.has_value());
        QCOMPARE(hit->result.text, QString("kept across restarts"));
        QCOMPARE(hit->result.segments.size(), 1);
        QCOMPARE(hit->result.segments.first().endMs, qint64(1500));
        QCOMPARE(hit->createdAt, now_);
        QCOMPARE(hit->modelName, QString("base"));

        QVERIFY(reopened.invalidate("persisted"));
        ASSERT_FILE_NOT_EXISTS(QDir(directory).filePath(ResultCache::fileNameFor("persisted")));
    }

    void testCorruptFilesAreDiscarded() {
        const QString directory = TestUtils::createTempDirectory("cache");
        const QString corrupt = TestUtils::writeFile(directory, ResultCache::fileNameFor("broken"), "{not json");
        const QString mismatched = TestUtils::writeFile(
            directory, ResultCache::fileNameFor("other"),
            QJsonDocument(makeEntry("renamed", "x").toJson()).toJson());
        QVERIFY(!corrupt.isEmpty());
        QVERIFY(!mismatched.isEmpty());

        CacheOptions options;
        options.persistencePath = directory;
        ResultCache cache(options, clock());
        auto loaded = cache.initialize();
        ASSERT_EXPECTED_VALUE(loaded);
        QCOMPARE(loaded.value(), 0);
        ASSERT_FILE_NOT_EXISTS(corrupt);
        ASSERT_FILE_NOT_EXISTS(mismatched);
    }

    void testEntryJsonRejectsMissingFields() {
        QJsonObject json = makeEntry("abc", "x").toJson();
        json.remove("createdAt");
        ASSERT_EXPECTED_ERROR(CacheEntry::fromJson(json), CacheError::Corrupt);
    }

    void testEntryWithoutFingerprintIsIgnored() {
        ResultCache cache({}, clock());
        cache.store(makeEntry(QString(), "nothing"));
        QCOMPARE(cache.size(), 0);
    }

private:
    ResultCache::Clock clock() {
        return [this]() { return now_; };
    }

    QDateTime now_;
};

int runTestResultCache(int argc, char** argv) {
    TestResultCache test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_result_cache.moc"
