#pragma once

#include <QtCore/QString>
#include <memory>

#include "core/common/Config.hpp"
#include "core/media/AudioConverter.hpp"
#include "core/queue/JobQueue.hpp"
#include "core/storage/ResultCache.hpp"
#include "core/transcription/ModelCatalog.hpp"
#include "core/transcription/ModelSource.hpp"
#include "core/transcription/ModelStore.hpp"
#include "core/transcription/PipelineHooks.hpp"
#include "core/transcription/SpeechDecoder.hpp"
#include "core/transcription/TranscriptionEngine.hpp"

namespace WhisperKit {

struct PipelineSettings {
    Config::ModelSettings models;
    Config::CacheSettings cache;
    Config::QueueSettings queue;
    Config::EngineSettings engine;
    Config::LoggingSettings logging;

    static PipelineSettings fromConfig(const Config& config);
};

// Replacements for the production collaborators; null members get the defaults
struct PipelineComponents {
    std::shared_ptr<ModelSource> modelSource;
    std::shared_ptr<SpeechDecoder> decoder;
    std::shared_ptr<AudioConverter> converter;
    PipelineHooks hooks;
};

/**
 * @brief Wires catalog, model store, result cache, engine and job queue together.
 */
class Pipeline {
public:
    explicit Pipeline(const PipelineSettings& settings, PipelineComponents components = {});
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    JobId submit(const TranscriptionRequest& request);

    // Points the logger at settings.logFilePath (default: <data dir>/whisperkit.log)
    static void configureLogging(const Config::LoggingSettings& settings);

    ModelCatalog& catalog() { return *catalog_; }
    ModelStore& modelStore() { return *modelStore_; }
    TranscriptionEngine& engine() { return *engine_; }
    JobQueue& queue() { return *queue_; }
    // Null when caching is disabled
    ResultCache* cache() { return cache_.get(); }

    const PipelineSettings& settings() const { return settings_; }

private:
    PipelineSettings settings_;
    std::shared_ptr<ModelCatalog> catalog_;
    std::shared_ptr<ModelStore> modelStore_;
    std::shared_ptr<ResultCache> cache_;
    std::shared_ptr<TranscriptionEngine> engine_;
    std::unique_ptr<JobQueue> queue_;
};

} // namespace WhisperKit
