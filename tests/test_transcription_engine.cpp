#include <QtTest/QtTest>
#include <QtCore/QDir>
#include <QtCore/QJsonArray>
#include <QtCore/QThread>
#include <QtConcurrent/QtConcurrent>

#include "core/transcription/Fingerprint.hpp"
#include "core/transcription/TranscriptionEngine.hpp"
#include "core/transcription/WhisperDecoder.hpp"
#include "utils/FakeComponents.hpp"
#include "utils/TestUtils.hpp"

using namespace WhisperKit;
using namespace WhisperKit::Test;

class TestTranscriptionEngine : public QObject {
    Q_OBJECT

private slots:
    void init() {
        workDir_ = TestUtils::createTempDirectory("engine");
        tempDir_ = QDir(workDir_).filePath("tmp");
        QVERIFY(QDir().mkpath(tempDir_));
        modelPath_ = TestUtils::writeFile(workDir_, "ggml-base.bin", TestUtils::makeModelBytes(512));
        audioPath_ = TestUtils::writeWav(workDir_, "speech.wav", 1000);
        QVERIFY(!modelPath_.isEmpty());
        QVERIFY(!audioPath_.isEmpty());

        decoder_ = std::make_shared<FakeSpeechDecoder>();
        converter_ = std::make_shared<FakeAudioConverter>();
    }

    void cleanup() {
        decoder_.reset();
        converter_.reset();
    }

    void testTranscribesRequiredFormatDirectly() {
        auto engine = makeEngine();
        auto result = engine->transcribe(request(audioPath_), modelPath_);

        ASSERT_EXPECTED_VALUE(result);
        QCOMPARE(result.value().text, QString("hello world"));
        QCOMPARE(result.value().language, QString("en"));
        QCOMPARE(result.value().segments.size(), 1);
        QCOMPARE(result.value().segments.first().startMs, qint64(0));
        QCOMPARE(result.value().segments.first().endMs, qint64(1500));
        QVERIFY(!result.value().conversionFallback);
        QVERIFY(result.value().processingTimeMs >= 0);

        QCOMPARE(converter_->callCount(), 0);
        QCOMPARE(decoder_->lastRequest().value("audio").toString(), audioPath_);
    }

    void testDecoderRequestPayload() {
        auto engine = makeEngine();
        TranscriptionRequest req = request(audioPath_);
        req.language = "de";
        req.translate = true;
        req.emitTimestamps = false;
        req.splitOnWord = true;
        req.threads = 3;
        req.processors = 2;
        ASSERT_EXPECTED_VALUE(engine->transcribe(req, modelPath_));

        const QJsonObject payload = decoder_->lastRequest();
        QCOMPARE(payload.value("@type").toString(), DecoderRequest::TranscribeType);
        QCOMPARE(payload.value("model").toString(), modelPath_);
        QCOMPARE(payload.value("language").toString(), QString("de"));
        QCOMPARE(payload.value("is_translate").toBool(), true);
        QCOMPARE(payload.value("is_no_timestamps").toBool(), true);
        QCOMPARE(payload.value("split_on_word").toBool(), true);
        QCOMPARE(payload.value("threads").toInt(), 3);
        QCOMPARE(payload.value("processors").toInt(), 2);
    }

    void testDefaultThreadCountIsClamped() {
        const int threads = TranscriptionEngine::defaultThreadCount();
        QVERIFY(threads >= 1 && threads <= 8);
        QCOMPARE(threads, qBound(1, QThread::idealThreadCount(), 8));
        QCOMPARE(TranscriptionEngine::resolveThreadCount(0), threads);
        QCOMPARE(TranscriptionEngine::resolveThreadCount(3), 3);
        QCOMPARE(TranscriptionEngine::resolveThreadCount(12), 8);
        QCOMPARE(TranscriptionEngine::resolveThreadCount(-2), threads);

        auto engine = makeEngine();
        ASSERT_EXPECTED_VALUE(engine->transcribe(request(audioPath_), modelPath_));
        QCOMPARE(decoder_->lastRequest().value("threads").toInt(), threads);
        QCOMPARE(decoder_->lastRequest().value("processors").toInt(), threads);
    }

    void testConvertsOtherFormats() {
        const QString stereo = TestUtils::writeWav(workDir_, "stereo.wav", 500, 44100, 2);
        auto engine = makeEngine();

        auto result = engine->transcribe(request(stereo), modelPath_);
        ASSERT_EXPECTED_VALUE(result);
        QVERIFY(!result.value().conversionFallback);
        QCOMPARE(converter_->callCount(), 1);
        QCOMPARE(decoder_->lastRequest().value("audio").toString(), converter_->lastOutputPath());

        // Converted file is gone once the call returns
        ASSERT_FILE_NOT_EXISTS(converter_->lastOutputPath());
        QVERIFY(QDir(tempDir_).isEmpty());
    }

    void testConversionFailureFallsBackToOriginal() {
        const QString mp3 = TestUtils::writeFile(workDir_, "clip.mp3", QByteArray("ID3 fake mpeg payload"));
        converter_->setSucceed(false);
        auto engine = makeEngine();

        auto result = engine->transcribe(request(mp3), modelPath_);
        ASSERT_EXPECTED_VALUE(result);
        QVERIFY(result.value().conversionFallback);
        QCOMPARE(decoder_->lastRequest().value("audio").toString(), mp3);
        QVERIFY(QDir(tempDir_).isEmpty());
    }

    void testMissingConverterFallsBack() {
        const QString stereo = TestUtils::writeWav(workDir_, "stereo.wav", 200, 22050, 2);
        TranscriptionEngine engine(decoder_, nullptr, {}, options());

        auto result = engine.transcribe(request(stereo), modelPath_);
        ASSERT_EXPECTED_VALUE(result);
        QVERIFY(result.value().conversionFallback);
    }

    void testInvalidInput() {
        auto engine = makeEngine();

        ASSERT_EXPECTED_ERROR(engine->transcribe(request(QDir(workDir_).filePath("missing.wav")), modelPath_),
                              EngineError::InvalidInput);

        const QString empty = TestUtils::writeFile(workDir_, "empty.wav", QByteArray());
        ASSERT_EXPECTED_ERROR(engine->transcribe(request(empty), modelPath_), EngineError::InvalidInput);

        ASSERT_EXPECTED_ERROR(engine->transcribe(request(audioPath_), QDir(workDir_).filePath("nope.bin")),
                              EngineError::InvalidInput);
        QCOMPARE(decoder_->callCount(), 0);
    }

    void testUnavailableDecoder() {
        decoder_->setAvailable(false);
        auto engine = makeEngine();
        ASSERT_EXPECTED_ERROR(engine->transcribe(request(audioPath_), modelPath_), EngineError::DecoderUnavailable);
        QVERIFY(engine->decoderVersion().isEmpty());

        TranscriptionEngine noDecoder(nullptr, converter_, {}, options());
        ASSERT_EXPECTED_ERROR(noDecoder.transcribe(request(audioPath_), modelPath_), EngineError::DecoderUnavailable);
    }

    void testDecoderErrorMessageIsReported() {
        QJsonObject failure;
        failure["@type"] = DecoderRequest::TranscribeType;
        failure["message"] = QStringLiteral("whisper_full failed with code -7");
        decoder_->setResponse(failure);
        auto engine = makeEngine();

        auto result = engine->transcribe(request(audioPath_), modelPath_);
        ASSERT_EXPECTED_ERROR(result, EngineError::ProcessingFailed);
        QCOMPARE(result.error().reason, QString("whisper_full failed with code -7"));
    }

    void testTimeoutAbortsDecoder() {
        const QString stereo = TestUtils::writeWav(workDir_, "stereo.wav", 300, 44100, 2);
        decoder_->setDelayMs(5000);
        auto engine = makeEngine();
        engine->setDecodeTimeout(100);

        QElapsedTimer timer;
        timer.start();
        auto result = engine->transcribe(request(stereo), modelPath_);
        ASSERT_EXPECTED_ERROR(result, EngineError::Timeout);
        QVERIFY(timer.elapsed() < 4000);

        QVERIFY(TestUtils::waitForCondition([this]() { return decoder_->abortedCount() == 1; }, 3000));
        QVERIFY(TestUtils::waitForCondition([this]() { return QDir(tempDir_).isEmpty(); }, 3000));
    }

    void testQueuedDecodeDoesNotCountAgainstTimeout() {
        EngineOptions engineOptions = options();
        engineOptions.maxConcurrentDecodes = 1;
        engineOptions.decodeTimeoutMs = 500;
        TranscriptionEngine engine(decoder_, converter_, PipelineHooks{}, engineOptions);
        decoder_->setDelayMs(300);

        const QString second = TestUtils::writeWav(workDir_, "second.wav", 1000);
        auto first = QtConcurrent::run([&engine, this]() { return engine.transcribe(request(audioPath_), modelPath_); });
        auto other = QtConcurrent::run([&engine, this, second]() { return engine.transcribe(request(second), modelPath_); });

        auto firstResult = first.result();
        auto otherResult = other.result();
        ASSERT_EXPECTED_VALUE(firstResult);
        ASSERT_EXPECTED_VALUE(otherResult);
        QCOMPARE(decoder_->callCount(), 2);
        QCOMPARE(decoder_->abortedCount(), 0);
    }

    void testChunkRangesCoverAudio() {
        const auto single = WhisperDecoder::chunkRanges(48000, 1);
        QCOMPARE(single.size(), size_t(1));
        QCOMPARE(single.front().first, size_t(0));
        QCOMPARE(single.front().second, size_t(48000));

        const auto split = WhisperDecoder::chunkRanges(50000, 3);
        QCOMPARE(split.size(), size_t(3));
        size_t expectedBegin = 0;
        for (const auto& range : split) {
            QCOMPARE(range.first, expectedBegin);
            QVERIFY(range.second - range.first >= WhisperDecoder::MinChunkSamples);
            expectedBegin = range.second;
        }
        QCOMPARE(expectedBegin, size_t(50000));

        // Never shorter than a second per range
        QCOMPARE(WhisperDecoder::chunkRanges(20000, 4).size(), size_t(1));
        QCOMPARE(WhisperDecoder::chunkRanges(32000, 8).size(), size_t(2));
        QCOMPARE(WhisperDecoder::chunkRanges(100, 0).size(), size_t(1));
    }

    void testHooksRunInOrder() {
        auto preprocessor = std::make_shared<CountingPreprocessor>();
        PipelineHooks hooks;
        hooks.preprocessors.push_back(preprocessor);
        hooks.postprocessors.push_back(std::make_shared<AppendSegmentPostprocessor>());
        hooks.formatters.push_back(std::make_shared<UpperCaseFormatter>());
        QVERIFY(!hooks.isEmpty());

        TranscriptionEngine engine(decoder_, converter_, hooks, options());
        auto result = engine.transcribe(request(audioPath_), modelPath_);

        ASSERT_EXPECTED_VALUE(result);
        QCOMPARE(preprocessor->callCount(), 1);
        QCOMPARE(preprocessor->lastSize(), qint64(32000));
        QCOMPARE(result.value().text, QString("HELLO WORLD"));
        QCOMPARE(result.value().segments.size(), 2);
        QCOMPARE(result.value().segments.last().text, QString("[end]"));
        QCOMPARE(result.value().segments.last().startMs, qint64(1500));

        // Preprocessed audio went to the decoder and was removed afterwards
        const QString decoded = decoder_->lastRequest().value("audio").toString();
        QVERIFY(decoded != audioPath_);
        ASSERT_FILE_NOT_EXISTS(decoded);
    }

    void testPreprocessorsSkippedOnFallback() {
        auto preprocessor = std::make_shared<CountingPreprocessor>();
        PipelineHooks hooks;
        hooks.preprocessors.push_back(preprocessor);
        converter_->setSucceed(false);

        const QString mp3 = TestUtils::writeFile(workDir_, "clip.mp3", QByteArray("ID3 fake mpeg payload"));
        TranscriptionEngine engine(decoder_, converter_, hooks, options());
        ASSERT_EXPECTED_VALUE(engine.transcribe(request(mp3), modelPath_));
        QCOMPARE(preprocessor->callCount(), 0);
    }

    void testLanguageFallsBackToRequest() {
        QJsonObject response = FakeSpeechDecoder::textResponse("bonjour");
        response.remove("language");
        decoder_->setResponse(response);
        auto engine = makeEngine();

        TranscriptionRequest req = request(audioPath_);
        req.language = "fr";
        auto result = engine->transcribe(req, modelPath_);
        ASSERT_EXPECTED_VALUE(result);
        QCOMPARE(result.value().language, QString("fr"));
    }

    void testParseDecoderResponse() {
        QJsonObject segment;
        segment["from_ts"] = 123;
        segment["to_ts"] = 456;
        segment["text"] = QStringLiteral("  padded ");
        QJsonObject response;
        response["text"] = QStringLiteral(" padded ");
        response["segments"] = QJsonArray{segment};

        auto parsed = TranscriptionEngine::parseDecoderResponse(response);
        ASSERT_EXPECTED_VALUE(parsed);
        QCOMPARE(parsed.value().text, QString("padded"));
        QCOMPARE(parsed.value().segments.first().startMs, qint64(1230));
        QCOMPARE(parsed.value().segments.first().endMs, qint64(4560));
        QCOMPARE(parsed.value().segments.first().text, QString("padded"));

        auto empty = TranscriptionEngine::parseDecoderResponse(QJsonObject());
        ASSERT_EXPECTED_ERROR(empty, EngineError::ProcessingFailed);
        QCOMPARE(empty.error().reason, QString("Decoder returned no text"));
    }

    void testDecoderVersion() {
        auto engine = makeEngine();
        QCOMPARE(engine->decoderVersion(), QString("fake-1.0"));
        QCOMPARE(decoder_->callCount(), 0);
    }

    void testFingerprint() {
        TranscriptionRequest req = request(audioPath_);
        auto base = Fingerprint::compute(req);
        ASSERT_EXPECTED_VALUE(base);
        QCOMPARE(base.value().size(), 64);

        TranscriptionRequest reprioritized = req;
        reprioritized.priority = Priority::Urgent;
        reprioritized.threads = 7;
        QCOMPARE(Fingerprint::compute(reprioritized).value(), base.value());

        const QString copy = QDir(workDir_).filePath("copy.wav");
        QVERIFY(QFile::copy(audioPath_, copy));
        QCOMPARE(Fingerprint::compute(request(copy)).value(), base.value());

        TranscriptionRequest otherModel = req;
        otherModel.modelName = "tiny";
        QVERIFY(Fingerprint::compute(otherModel).value() != base.value());

        TranscriptionRequest translated = req;
        translated.translate = true;
        QVERIFY(Fingerprint::compute(translated).value() != base.value());

        TranscriptionRequest words = req;
        words.splitOnWord = true;
        QVERIFY(Fingerprint::compute(words).value() != base.value());

        ASSERT_EXPECTED_ERROR(Fingerprint::compute(request(QDir(workDir_).filePath("missing.wav"))),
                              EngineError::InvalidInput);
    }

private:
    EngineOptions options() const {
        EngineOptions engineOptions;
        engineOptions.tempPath = tempDir_;
        engineOptions.decodeTimeoutMs = 10000;
        return engineOptions;
    }

    std::unique_ptr<TranscriptionEngine> makeEngine() const {
        return std::make_unique<TranscriptionEngine>(decoder_, converter_, PipelineHooks{}, options());
    }

    static TranscriptionRequest request(const QString& audioPath) {
        TranscriptionRequest req;
        req.audioPath = audioPath;
        req.modelName = "base";
        return req;
    }

    QString workDir_;
    QString tempDir_;
    QString modelPath_;
    QString audioPath_;
    std::shared_ptr<FakeSpeechDecoder> decoder_;
    std::shared_ptr<FakeAudioConverter> converter_;
};

int runTestTranscriptionEngine(int argc, char** argv) {
    TestTranscriptionEngine test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_transcription_engine.moc"
