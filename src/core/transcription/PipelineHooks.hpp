#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <memory>
#include <vector>

#include "TranscriptionTypes.hpp"

namespace WhisperKit {

// Hooks are shared between worker threads and must be safe to call concurrently.

class AudioPreprocessor {
public:
    virtual ~AudioPreprocessor() = default;
    virtual QString name() const = 0;
    // Receives and returns 16 kHz mono signed 16-bit little-endian samples
    virtual QByteArray process(const QByteArray& pcm) = 0;
};

class ResultPostprocessor {
public:
    virtual ~ResultPostprocessor() = default;
    virtual QString name() const = 0;
    virtual TranscriptionResult process(const TranscriptionResult& result) = 0;
};

class TextFormatter {
public:
    virtual ~TextFormatter() = default;
    virtual QString name() const = 0;
    virtual QString format(const QString& text) = 0;
};

/**
 * @brief Ordered extension points applied by TranscriptionEngine.
 *
 * Preprocessors run in order on the prepared audio, postprocessors on the
 * parsed result, then formatters on the final text.
 */
struct PipelineHooks {
    std::vector<std::shared_ptr<AudioPreprocessor>> preprocessors;
    std::vector<std::shared_ptr<ResultPostprocessor>> postprocessors;
    std::vector<std::shared_ptr<TextFormatter>> formatters;

    bool isEmpty() const {
        return preprocessors.empty() && postprocessors.empty() && formatters.empty();
    }
};

} // namespace WhisperKit
