#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <functional>

#include "core/common/Expected.hpp"

namespace WhisperKit {

enum class SourceError {
    InvalidUrl,
    NetworkError,
    ServerError,
    TimeoutError,
    Aborted
};

struct SourceFailure {
    SourceError code = SourceError::NetworkError;
    QString reason;
};

struct FetchCallbacks {
    // Called once before the first chunk; -1 when there is no Content-Length
    std::function<void(qint64 contentLength)> onResponse;
    // Return false to stop the transfer; fetch() then fails with SourceError::Aborted
    std::function<bool(const QByteArray& chunk)> onChunk;
};

/**
 * @brief Streaming byte source for model weight files.
 *
 * fetch() blocks the calling thread until the body has been delivered
 * chunk by chunk or the transfer failed.
 */
class ModelSource {
public:
    virtual ~ModelSource() = default;

    virtual Expected<void, SourceFailure> fetch(const QString& url, const FetchCallbacks& callbacks) = 0;
};

} // namespace WhisperKit
