#include <QtTest/QtTest>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtConcurrent/QtConcurrent>

#include "core/transcription/ModelCatalog.hpp"
#include "core/transcription/ModelStore.hpp"
#include "utils/FakeComponents.hpp"
#include "utils/TestUtils.hpp"

using namespace WhisperKit;
using namespace WhisperKit::Test;

class TestModelStore : public QObject {
    Q_OBJECT

private slots:
    void init() {
        modelsPath_ = TestUtils::createTempDirectory("models");
        QVERIFY(!modelsPath_.isEmpty());
        catalog_ = std::make_unique<ModelCatalog>(modelsPath_);
        source_ = std::make_shared<FakeModelSource>(TestUtils::makeModelBytes(8192));
        source_->setChunkSize(1024);
        store_ = std::make_unique<ModelStore>(source_);
    }

    void cleanup() {
        store_.reset();
        source_.reset();
        catalog_.reset();
    }

    void testDownloadsMissingModel() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        QSignalSpy started(store_.get(), &ModelStore::downloadStarted);
        QSignalSpy completed(store_.get(), &ModelStore::downloadCompleted);

        QList<qint64> progress;
        auto result = store_->ensureAvailable(tiny, [&progress](qint64 received, qint64) {
            progress.append(received);
        });

        ASSERT_EXPECTED_VALUE(result);
        QCOMPARE(result.value(), tiny.localPath());
        ASSERT_FILE_EXISTS(tiny.localPath());
        ASSERT_FILE_NOT_EXISTS(tiny.localPath() + ModelStore::PartialSuffix);
        QCOMPARE(QFileInfo(tiny.localPath()).size(), qint64(8192));

        QCOMPARE(started.count(), 1);
        QCOMPARE(completed.count(), 1);
        QCOMPARE(progress.size(), 8);
        QCOMPARE(progress.last(), qint64(8192));

        const DownloadState state = store_->downloadState(tiny.name());
        QCOMPARE(state.kind, DownloadState::Kind::Completed);
        QCOMPARE(state.bytesTotal, qint64(8192));
        QVERIFY(store_->isAvailable(tiny));
    }

    void testExistingModelIsNotFetched() {
        const ModelDescriptor base = catalog_->descriptor(ModelType::Base);
        QVERIFY(!TestUtils::writeFile(modelsPath_, base.fileName(), TestUtils::makeModelBytes(256)).isEmpty());

        auto result = store_->ensureAvailable(base);
        ASSERT_EXPECTED_VALUE(result);
        QCOMPARE(source_->fetchCount(), 0);
        QCOMPARE(store_->downloadCount(), 0);
    }

    void testForcedDownloadReplacesLocalCopy() {
        const ModelDescriptor base = catalog_->descriptor(ModelType::Base);
        QVERIFY(!TestUtils::writeFile(modelsPath_, base.fileName(), TestUtils::makeModelBytes(256)).isEmpty());

        auto result = store_->download(base);
        ASSERT_EXPECTED_VALUE(result);
        QCOMPARE(source_->fetchCount(), 1);
        QCOMPARE(QFileInfo(base.localPath()).size(), qint64(8192));
    }

    void testInvalidLocalFileIsRedownloaded() {
        const ModelDescriptor small = catalog_->descriptor(ModelType::Small);
        QVERIFY(!TestUtils::writeFile(modelsPath_, small.fileName(), QByteArray("<html>error</html>")).isEmpty());
        QVERIFY(!store_->isAvailable(small));

        auto result = store_->ensureAvailable(small);
        ASSERT_EXPECTED_VALUE(result);
        QCOMPARE(source_->fetchCount(), 1);
        QVERIFY(store_->isAvailable(small));
    }

    void testConcurrentCallersShareOneDownload() {
        const ModelDescriptor medium = catalog_->descriptor(ModelType::Medium);
        source_->setChunkSize(512);
        source_->setChunkDelayMs(10);

        QList<QFuture<Expected<QString, ModelStoreError>>> futures;
        for (int i = 0; i < 5; ++i) {
            futures.append(QtConcurrent::run([this, medium]() {
                return store_->ensureAvailable(medium);
            }));
        }

        for (auto& future : futures) {
            future.waitForFinished();
            auto result = future.result();
            ASSERT_EXPECTED_VALUE(result);
            QCOMPARE(result.value(), medium.localPath());
        }

        QCOMPARE(source_->fetchCount(), 1);
        QCOMPARE(store_->downloadCount(), 1);
    }

    void testConcurrentCallersShareFailure() {
        const ModelDescriptor medium = catalog_->descriptor(ModelType::Medium);
        source_->setChunkSize(512);
        source_->setChunkDelayMs(10);
        source_->setFailure(SourceFailure{SourceError::ServerError, "HTTP 503"}, 4096);

        QList<QFuture<Expected<QString, ModelStoreError>>> futures;
        for (int i = 0; i < 3; ++i) {
            futures.append(QtConcurrent::run([this, medium]() {
                return store_->ensureAvailable(medium);
            }));
        }

        for (auto& future : futures) {
            future.waitForFinished();
            auto result = future.result();
            ASSERT_EXPECTED_ERROR(result, ModelError::DownloadFailed);
            QVERIFY(result.error().reason.contains("503"));
        }
        QCOMPARE(source_->fetchCount(), 1);
    }

    void testBadMagicLeavesNoFiles() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        source_->setBody(TestUtils::makeModelBytes(4096, QByteArrayLiteral("<!DO")));
        QSignalSpy failed(store_.get(), &ModelStore::downloadFailed);

        auto result = store_->ensureAvailable(tiny);
        ASSERT_EXPECTED_ERROR(result, ModelError::CorruptDownload);
        ASSERT_FILE_NOT_EXISTS(tiny.localPath());
        ASSERT_FILE_NOT_EXISTS(tiny.localPath() + ModelStore::PartialSuffix);
        QCOMPARE(failed.count(), 1);
        QCOMPARE(store_->downloadState(tiny.name()).kind, DownloadState::Kind::Failed);
    }

    void testLegacyMagicIsReadAsStored() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        source_->setBody(TestUtils::makeModelBytes(4096, QByteArrayLiteral("ggjt")));
        auto rejected = store_->ensureAvailable(tiny);
        ASSERT_EXPECTED_ERROR(rejected, ModelError::CorruptDownload);
        ASSERT_FILE_NOT_EXISTS(tiny.localPath());

        source_->setBody(TestUtils::makeModelBytes(4096, QByteArrayLiteral("tjgg")));
        auto accepted = store_->ensureAvailable(tiny);
        ASSERT_EXPECTED_VALUE(accepted);
        ASSERT_FILE_EXISTS(tiny.localPath());
    }

    void testShortBodyIsCorrupt() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        source_->setAnnouncedLength(10000);

        auto result = store_->ensureAvailable(tiny);
        ASSERT_EXPECTED_ERROR(result, ModelError::CorruptDownload);
        QVERIFY(result.error().reason.contains("10000"));
        ASSERT_FILE_NOT_EXISTS(tiny.localPath());
        ASSERT_FILE_NOT_EXISTS(tiny.localPath() + ModelStore::PartialSuffix);
    }

    void testExpectedSizeMismatch() {
        const ModelDescriptor custom("custom", 4096, ModelCatalog::DefaultUrlTemplate,
                                     "ggml-custom.bin", QDir(modelsPath_).filePath("ggml-custom.bin"));

        auto result = store_->ensureAvailable(custom);
        ASSERT_EXPECTED_ERROR(result, ModelError::CorruptDownload);
        ASSERT_FILE_NOT_EXISTS(custom.localPath());
    }

    void testUnknownLengthIsAccepted() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        source_->setAnnouncedLength(-1);

        QList<qint64> totals;
        auto result = store_->ensureAvailable(tiny, [&totals](qint64, qint64 total) { totals.append(total); });
        ASSERT_EXPECTED_VALUE(result);
        QVERIFY(!totals.isEmpty());
        QCOMPARE(totals.first(), qint64(-1));
    }

    void testNetworkFailureCleansUp() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        source_->setFailure(SourceFailure{SourceError::NetworkError, "Connection reset"}, 2048);

        auto result = store_->ensureAvailable(tiny);
        ASSERT_EXPECTED_ERROR(result, ModelError::DownloadFailed);
        QCOMPARE(result.error().reason, QString("Connection reset"));
        ASSERT_FILE_NOT_EXISTS(tiny.localPath() + ModelStore::PartialSuffix);
        QCOMPARE(store_->downloadState(tiny.name()).reason, QString("Connection reset"));

        // A later attempt starts over
        source_ = std::make_shared<FakeModelSource>(TestUtils::makeModelBytes(1024));
        store_ = std::make_unique<ModelStore>(source_);
        ASSERT_EXPECTED_VALUE(store_->ensureAvailable(tiny));
    }

    void testDownloadTimeout() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        source_->setBody(TestUtils::makeModelBytes(64 * 256));
        source_->setChunkSize(256);
        source_->setChunkDelayMs(5);
        store_->setDownloadTimeout(30);

        auto result = store_->ensureAvailable(tiny);
        ASSERT_EXPECTED_ERROR(result, ModelError::DownloadFailed);
        QVERIFY(result.error().reason.contains("timed out"));
        ASSERT_FILE_NOT_EXISTS(tiny.localPath());
        ASSERT_FILE_NOT_EXISTS(tiny.localPath() + ModelStore::PartialSuffix);
    }

    void testInvalidDescriptor() {
        auto result = store_->ensureAvailable(ModelDescriptor());
        ASSERT_EXPECTED_ERROR(result, ModelError::UnknownModel);
        QCOMPARE(source_->fetchCount(), 0);
    }

    void testDownloadHostResolution() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        store_->setDownloadHost("https://mirror.example.org/models/");
        ASSERT_EXPECTED_VALUE(store_->ensureAvailable(tiny));
        QCOMPARE(source_->requestedUrls().value(0), QString("https://mirror.example.org/models/ggml-tiny.bin"));

        store_->setDownloadHost(QString());
        QCOMPARE(store_->downloadHost(), ModelStore::DefaultDownloadHost);
        ASSERT_EXPECTED_VALUE(store_->download(tiny));
        QCOMPARE(source_->requestedUrls().value(1), ModelStore::DefaultDownloadHost + "/ggml-tiny.bin");
    }

    void testRemove() {
        const ModelDescriptor tiny = catalog_->descriptor(ModelType::Tiny);
        ASSERT_EXPECTED_VALUE(store_->ensureAvailable(tiny));
        ASSERT_EXPECTED_VALUE(store_->remove(tiny));
        ASSERT_FILE_NOT_EXISTS(tiny.localPath());
        QCOMPARE(store_->downloadState(tiny.name()).kind, DownloadState::Kind::Idle);
    }

    void testCatalogLookup() {
        QVERIFY(catalog_->find("large-v2").has_value());
        QVERIFY(!catalog_->find("enormous").has_value());
        QCOMPARE(catalog_->descriptor(ModelType::Base).localPath(), QDir(modelsPath_).filePath("ggml-base.bin"));

        const ModelDescriptor custom("custom", 0, ModelCatalog::DefaultUrlTemplate,
                                     "ggml-custom.bin", QDir(modelsPath_).filePath("ggml-custom.bin"));
        QVERIFY(catalog_->addCustomModel(custom));
        QVERIFY(!catalog_->addCustomModel(ModelDescriptor()));
        QVERIFY(catalog_->names().contains("custom"));
    }

private:
    QString modelsPath_;
    std::unique_ptr<ModelCatalog> catalog_;
    std::shared_ptr<FakeModelSource> source_;
    std::unique_ptr<ModelStore> store_;
};

int runTestModelStore(int argc, char** argv) {
    TestModelStore test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_model_store.moc"
