#pragma once

#include <QtCore/QString>
#include <QtCore/QList>
#include <QtCore/QDateTime>
#include <QtCore/QMetaType>
#include <utility>

namespace WhisperKit {

// Language hint that asks the decoder to detect the spoken language
inline const QString AutoDetectLanguage = QStringLiteral("auto");

enum class Priority {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

/**
 * @brief Identifies one downloadable model variant.
 *
 * Built by ModelCatalog (or by callers for custom models) and never mutated.
 */
class ModelDescriptor {
public:
    ModelDescriptor() = default;
    ModelDescriptor(QString name, qint64 expectedSize, QString urlTemplate,
                    QString fileName, QString localPath)
        : name_(std::move(name))
        , expectedSize_(expectedSize)
        , urlTemplate_(std::move(urlTemplate))
        , fileName_(std::move(fileName))
        , localPath_(std::move(localPath)) {}

    const QString& name() const { return name_; }
    qint64 expectedSize() const { return expectedSize_; } // 0 when unknown
    const QString& urlTemplate() const { return urlTemplate_; }
    const QString& fileName() const { return fileName_; }
    const QString& localPath() const { return localPath_; }

    bool isValid() const {
        return !name_.isEmpty() && !fileName_.isEmpty() && !localPath_.isEmpty();
    }

    // Substitutes {host} and {modelFileName} in the URL template
    QString resolveUrl(const QString& host) const {
        QString url = urlTemplate_;
        QString trimmedHost = host;
        while (trimmedHost.endsWith('/')) {
            trimmedHost.chop(1);
        }
        url.replace(QStringLiteral("{host}"), trimmedHost);
        url.replace(QStringLiteral("{modelFileName}"), fileName_);
        return url;
    }

private:
    QString name_;
    qint64 expectedSize_ = 0;
    QString urlTemplate_;
    QString fileName_;
    QString localPath_;
};

struct DownloadState {
    enum class Kind {
        Idle,
        Downloading,
        Completed,
        Failed
    };

    Kind kind = Kind::Idle;
    qint64 bytesReceived = 0;
    qint64 bytesTotal = 0;   // -1 when the server did not say
    QString reason;          // set for Failed

    static DownloadState idle() { return {}; }
    static DownloadState downloading(qint64 received, qint64 total) {
        return {Kind::Downloading, received, total, QString()};
    }
    static DownloadState completed(qint64 total) { return {Kind::Completed, total, total, QString()}; }
    static DownloadState failed(const QString& why) { return {Kind::Failed, 0, 0, why}; }
};

struct TranscriptionRequest {
    QString audioPath;
    QString modelName = QStringLiteral("base");
    QString language = AutoDetectLanguage;
    bool translate = false;
    bool emitTimestamps = true;
    bool splitOnWord = false;
    int threads = 0;      // 0 = derive from core count
    int processors = 0;   // 0 = derive from core count
    Priority priority = Priority::Normal;
};

struct Segment {
    qint64 startMs = 0;
    qint64 endMs = 0;
    QString text;

    qint64 duration() const { return endMs - startMs; }

    bool operator==(const Segment& other) const {
        return startMs == other.startMs && endMs == other.endMs && text == other.text;
    }
};

struct TranscriptionResult {
    QString text;
    QList<Segment> segments;
    qint64 processingTimeMs = 0;
    QString language;
    bool conversionFallback = false; // input was decoded without format conversion

    bool sameContent(const TranscriptionResult& other) const {
        return text == other.text && segments == other.segments && language == other.language;
    }
};

inline QString priorityToString(Priority priority) {
    switch (priority) {
        case Priority::Low: return QStringLiteral("low");
        case Priority::Normal: return QStringLiteral("normal");
        case Priority::High: return QStringLiteral("high");
        case Priority::Urgent: return QStringLiteral("urgent");
    }
    return QStringLiteral("normal");
}

} // namespace WhisperKit

Q_DECLARE_METATYPE(WhisperKit::TranscriptionResult)
Q_DECLARE_METATYPE(WhisperKit::Priority)
