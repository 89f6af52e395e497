#pragma once

#include <QtCore/QString>

#include "core/common/Expected.hpp"

namespace WhisperKit {

enum class ConversionError {
    ToolUnavailable,
    Timeout,
    Failed
};

struct ConversionFailure {
    ConversionError code = ConversionError::Failed;
    QString reason;
};

// Produces a 16 kHz mono 16-bit PCM WAV at outputPath from any input audio
class AudioConverter {
public:
    virtual ~AudioConverter() = default;

    virtual Expected<void, ConversionFailure> convert(const QString& inputPath, const QString& outputPath) = 0;
};

} // namespace WhisperKit
