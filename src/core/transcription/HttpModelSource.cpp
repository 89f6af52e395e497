#include "HttpModelSource.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QUrl>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkRequest>
#include <memory>
#include <optional>

namespace WhisperKit {

HttpModelSource::HttpModelSource() = default;

void HttpModelSource::setUserAgent(const QString& userAgent) {
    userAgent_ = userAgent;
}

void HttpModelSource::setMaxRedirects(int maxRedirects) {
    maxRedirects_ = qMax(0, maxRedirects);
}

void HttpModelSource::setStallTimeout(int timeoutMs) {
    stallTimeoutMs_ = qMax(0, timeoutMs);
}

Expected<void, SourceFailure> HttpModelSource::fetch(const QString& url, const FetchCallbacks& callbacks) {
    auto urlValidation = validateUrl(url);
    if (urlValidation.hasError()) {
        return urlValidation;
    }

    // A local manager keeps the reply on this thread's event loop
    QNetworkAccessManager manager;
    QNetworkRequest request{QUrl(url)};
    request.setRawHeader("User-Agent", userAgent_.toUtf8());
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
    request.setMaximumRedirectsAllowed(maxRedirects_);
    if (stallTimeoutMs_ > 0) {
        request.setTransferTimeout(stallTimeoutMs_);
    }

    WHISPERKIT_INFO("HttpModelSource: GET {}", url.toStdString());
    std::unique_ptr<QNetworkReply> reply(manager.get(request));
    if (!reply) {
        return makeUnexpected(SourceFailure{SourceError::NetworkError, "Failed to create network reply"});
    }

    bool responseSeen = false;
    bool abortedByCaller = false;
    std::optional<SourceFailure> serverFailure;

    auto announceResponse = [&]() -> bool {
        if (responseSeen) {
            return true;
        }
        responseSeen = true;

        const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (httpStatus >= 400) {
            serverFailure = SourceFailure{SourceError::ServerError,
                                          QString("HTTP %1 from %2").arg(httpStatus).arg(url)};
            return false;
        }

        bool ok = false;
        qint64 contentLength = reply->header(QNetworkRequest::ContentLengthHeader).toLongLong(&ok);
        if (callbacks.onResponse) {
            callbacks.onResponse(ok ? contentLength : -1);
        }
        return true;
    };

    auto deliver = [&](const QByteArray& chunk) {
        if (chunk.isEmpty() || abortedByCaller || serverFailure) {
            return;
        }
        if (callbacks.onChunk && !callbacks.onChunk(chunk)) {
            abortedByCaller = true;
            reply->abort();
        }
    };

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::readyRead, &loop, [&]() {
        if (!announceResponse()) {
            reply->abort();
            return;
        }
        deliver(reply->readAll());
    });
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    if (!reply->isFinished()) {
        loop.exec();
    }

    if (serverFailure) {
        WHISPERKIT_ERROR("HttpModelSource: {}", serverFailure->reason.toStdString());
        return makeUnexpected(*serverFailure);
    }

    if (abortedByCaller) {
        return makeUnexpected(SourceFailure{SourceError::Aborted, "Transfer stopped by receiver"});
    }

    if (reply->error() != QNetworkReply::NoError) {
        SourceFailure failure{mapNetworkError(reply->error()), reply->errorString()};
        WHISPERKIT_ERROR("HttpModelSource: network error for {}: {}",
                         url.toStdString(), failure.reason.toStdString());
        return makeUnexpected(failure);
    }

    // Empty bodies never trigger readyRead
    if (!announceResponse()) {
        return makeUnexpected(*serverFailure);
    }
    deliver(reply->readAll());
    if (abortedByCaller) {
        return makeUnexpected(SourceFailure{SourceError::Aborted, "Transfer stopped by receiver"});
    }

    return Expected<void, SourceFailure>();
}

Expected<void, SourceFailure> HttpModelSource::validateUrl(const QString& url) {
    QUrl qurl(url);
    if (!qurl.isValid() || qurl.scheme().isEmpty()) {
        return makeUnexpected(SourceFailure{SourceError::InvalidUrl, QString("Invalid URL: %1").arg(url)});
    }

    if (qurl.scheme() != "http" && qurl.scheme() != "https") {
        return makeUnexpected(SourceFailure{SourceError::InvalidUrl,
                                            QString("Unsupported URL scheme: %1").arg(qurl.scheme())});
    }

    return Expected<void, SourceFailure>();
}

SourceError HttpModelSource::mapNetworkError(QNetworkReply::NetworkError error) {
    switch (error) {
        case QNetworkReply::TimeoutError:
        case QNetworkReply::OperationCanceledError:
            return SourceError::TimeoutError;
        case QNetworkReply::ContentNotFoundError:
        case QNetworkReply::InternalServerError:
        case QNetworkReply::ServiceUnavailableError:
        case QNetworkReply::ContentAccessDenied:
            return SourceError::ServerError;
        default:
            return SourceError::NetworkError;
    }
}

} // namespace WhisperKit
