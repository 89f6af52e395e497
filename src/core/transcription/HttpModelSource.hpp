#pragma once

#include <QtCore/QString>
#include <QtNetwork/QNetworkReply>

#include "ModelSource.hpp"

namespace WhisperKit {

/**
 * @brief ModelSource backed by QNetworkAccessManager.
 *
 * Each fetch uses its own QNetworkAccessManager and a local event loop so it
 * can run on any worker thread.
 */
class HttpModelSource : public ModelSource {
public:
    HttpModelSource();

    Expected<void, SourceFailure> fetch(const QString& url, const FetchCallbacks& callbacks) override;

    void setUserAgent(const QString& userAgent);
    void setMaxRedirects(int maxRedirects);
    // Aborts when no bytes arrive for this long; 0 disables
    void setStallTimeout(int timeoutMs);

private:
    static Expected<void, SourceFailure> validateUrl(const QString& url);
    static SourceError mapNetworkError(QNetworkReply::NetworkError error);

    QString userAgent_ = "WhisperKit/1.0";
    int maxRedirects_ = 5;
    int stallTimeoutMs_ = 60000;
};

} // namespace WhisperKit
