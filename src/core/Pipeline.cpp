#include "Pipeline.hpp"
#include "core/common/Logger.hpp"
#include "core/media/FfmpegAudioConverter.hpp"
#include "core/transcription/HttpModelSource.hpp"
#include "core/transcription/WhisperDecoder.hpp"

#include <QtCore/QDir>
#include <QtCore/QStandardPaths>
#include <QtCore/QThread>

namespace WhisperKit {

PipelineSettings PipelineSettings::fromConfig(const Config& config) {
    PipelineSettings settings;
    settings.models = config.getModelSettings();
    settings.cache = config.getCacheSettings();
    settings.queue = config.getQueueSettings();
    settings.engine = config.getEngineSettings();
    settings.logging = config.getLoggingSettings();
    return settings;
}

Pipeline::Pipeline(const PipelineSettings& settings, PipelineComponents components)
    : settings_(settings) {
    catalog_ = std::make_shared<ModelCatalog>(settings_.models.modelsPath);

    std::shared_ptr<ModelSource> source = components.modelSource
        ? components.modelSource
        : std::make_shared<HttpModelSource>();
    modelStore_ = std::make_shared<ModelStore>(source);
    modelStore_->setDownloadHost(settings_.models.downloadHost);
    modelStore_->setDownloadTimeout(settings_.models.downloadTimeoutMs);

    if (settings_.cache.enabled) {
        CacheOptions cacheOptions;
        cacheOptions.maxAgeMs = settings_.cache.maxAgeSeconds * 1000;
        cacheOptions.maxEntries = settings_.cache.maxEntries;
        cacheOptions.persistencePath = settings_.cache.cachePath;
        cache_ = std::make_shared<ResultCache>(cacheOptions);

        auto loaded = cache_->initialize();
        if (loaded.hasError()) {
            WHISPERKIT_WARN("Result cache running in memory only: {}", errorToString(loaded.error()).toStdString());
        }
    }

    std::shared_ptr<SpeechDecoder> decoder = components.decoder
        ? components.decoder
        : std::make_shared<WhisperDecoder>();
    std::shared_ptr<AudioConverter> converter = components.converter
        ? components.converter
        : std::make_shared<FfmpegAudioConverter>(settings_.engine.ffmpegPath, settings_.engine.conversionTimeoutMs);

    EngineOptions engineOptions;
    engineOptions.decodeTimeoutMs = settings_.engine.decodeTimeoutMs;
    engineOptions.tempPath = settings_.engine.tempPath;
    // Every queue worker must be able to hold a pool thread at once
    engineOptions.maxConcurrentDecodes = qMax(qMax(4, QThread::idealThreadCount()), settings_.queue.maxConcurrentJobs);
    engine_ = std::make_shared<TranscriptionEngine>(decoder, converter, std::move(components.hooks), engineOptions);

    JobQueueOptions queueOptions;
    queueOptions.maxConcurrent = settings_.queue.maxConcurrentJobs;
    queueOptions.maxRetainedResults = settings_.queue.maxRetainedResults;
    queue_ = std::make_unique<JobQueue>(catalog_, modelStore_, engine_, cache_, queueOptions);

    WHISPERKIT_INFO("Pipeline ready: models in {}, cache {}",
                    settings_.models.modelsPath.toStdString(),
                    settings_.cache.enabled ? settings_.cache.cachePath.toStdString() : std::string("disabled"));
}

Pipeline::~Pipeline() {
    // The queue's workers use every other component
    queue_.reset();
}

void Pipeline::configureLogging(const Config::LoggingSettings& settings) {
    QString path = settings.logFilePath;
    if (path.isEmpty()) {
        const QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
        if (!QDir().mkpath(dataPath)) {
            WHISPERKIT_WARN("Cannot create log directory {}", dataPath.toStdString());
        }
        path = QDir(dataPath).filePath("whisperkit.log");
    }
    Logger::instance().initialize(path.toStdString(),
                                  Logger::levelFromString(settings.level.toLower().toStdString()));
}

JobId Pipeline::submit(const TranscriptionRequest& request) {
    return queue_->enqueue(request);
}

} // namespace WhisperKit
