#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace WhisperKit {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "WhisperKit",
                    const QString& applicationName = "WhisperKit");

    // Reads and writes an explicit INI file instead of the platform store
    void initializeFromFile(const QString& iniFilePath);

    bool isInitialized() const;

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    qint64 getInt64(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    void setString(const QString& key, const QString& value);
    void setInt(const QString& key, int value);
    void setBool(const QString& key, bool value);

    struct ModelSettings {
        QString modelsPath;
        QString downloadHost;           // empty = default public repository
        int downloadTimeoutMs = 0;      // 0 = no timeout
        QString defaultModel = "base";
    };

    struct CacheSettings {
        bool enabled = true;
        QString cachePath;              // empty = in-memory only
        qint64 maxAgeSeconds = 7 * 24 * 60 * 60;
        int maxEntries = 100;
    };

    struct QueueSettings {
        int maxConcurrentJobs = 2;
        int maxRetainedResults = 256;
    };

    struct EngineSettings {
        int decodeTimeoutMs = 10 * 60 * 1000;
        QString tempPath;
        QString ffmpegPath = "ffmpeg";
        int conversionTimeoutMs = 60000;
    };

    struct LoggingSettings {
        QString logFilePath;
        QString level = "info";
    };

    ModelSettings getModelSettings() const;
    CacheSettings getCacheSettings() const;
    QueueSettings getQueueSettings() const;
    EngineSettings getEngineSettings() const;
    LoggingSettings getLoggingSettings() const;

    void setModelSettings(const ModelSettings& settings);
    void setCacheSettings(const CacheSettings& settings);
    void setQueueSettings(const QueueSettings& settings);
    void setEngineSettings(const EngineSettings& settings);
    void setLoggingSettings(const LoggingSettings& settings);

    QString getDataPath() const;
    QString getCachePath() const;
    QString getTempPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace WhisperKit
