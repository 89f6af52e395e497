#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QStringList>

namespace WhisperKit {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    WHISPERKIT_INFO("Config initialized for {}/{}",
                    organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniFilePath) {
    settings_ = std::make_unique<QSettings>(iniFilePath, QSettings::IniFormat);
    ensureDirectoriesExist();
    WHISPERKIT_INFO("Config initialized from {}", iniFilePath.toStdString());
}

bool Config::isInitialized() const {
    return settings_ != nullptr;
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

qint64 Config::getInt64(const QString& key, qint64 defaultValue) const {
    return getValue(key, defaultValue).toLongLong();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

void Config::setString(const QString& key, const QString& value) {
    setValue(key, value);
}

void Config::setInt(const QString& key, int value) {
    setValue(key, value);
}

void Config::setBool(const QString& key, bool value) {
    setValue(key, value);
}

Config::ModelSettings Config::getModelSettings() const {
    ModelSettings settings;
    settings.modelsPath = getString("models/path", getDataPath() + "/models");
    settings.downloadHost = getString("models/downloadHost");
    settings.downloadTimeoutMs = getInt("models/downloadTimeoutMs", 0);
    settings.defaultModel = getString("models/default", "base");
    return settings;
}

Config::CacheSettings Config::getCacheSettings() const {
    CacheSettings settings;
    settings.enabled = getBool("cache/enabled", true);
    settings.cachePath = getString("cache/path", getCachePath() + "/transcriptions");
    settings.maxAgeSeconds = getInt64("cache/maxAgeSeconds", settings.maxAgeSeconds);
    settings.maxEntries = getInt("cache/maxEntries", 100);
    return settings;
}

Config::QueueSettings Config::getQueueSettings() const {
    QueueSettings settings;
    settings.maxConcurrentJobs = qMax(1, getInt("queue/maxConcurrentJobs", 2));
    settings.maxRetainedResults = qMax(1, getInt("queue/maxRetainedResults", 256));
    return settings;
}

Config::EngineSettings Config::getEngineSettings() const {
    EngineSettings settings;
    settings.decodeTimeoutMs = getInt("engine/decodeTimeoutMs", settings.decodeTimeoutMs);
    settings.tempPath = getString("engine/tempPath", getTempPath());
    settings.ffmpegPath = getString("engine/ffmpegPath", "ffmpeg");
    settings.conversionTimeoutMs = getInt("engine/conversionTimeoutMs", 60000);
    return settings;
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    settings.logFilePath = getString("logging/file", getDataPath() + "/whisperkit.log");
    settings.level = getString("logging/level", "info");
    return settings;
}

void Config::setModelSettings(const ModelSettings& settings) {
    setValue("models/path", settings.modelsPath);
    setValue("models/downloadHost", settings.downloadHost);
    setValue("models/downloadTimeoutMs", settings.downloadTimeoutMs);
    setValue("models/default", settings.defaultModel);
}

void Config::setCacheSettings(const CacheSettings& settings) {
    setValue("cache/enabled", settings.enabled);
    setValue("cache/path", settings.cachePath);
    setValue("cache/maxAgeSeconds", settings.maxAgeSeconds);
    setValue("cache/maxEntries", settings.maxEntries);
}

void Config::setQueueSettings(const QueueSettings& settings) {
    setValue("queue/maxConcurrentJobs", settings.maxConcurrentJobs);
    setValue("queue/maxRetainedResults", settings.maxRetainedResults);
}

void Config::setEngineSettings(const EngineSettings& settings) {
    setValue("engine/decodeTimeoutMs", settings.decodeTimeoutMs);
    setValue("engine/tempPath", settings.tempPath);
    setValue("engine/ffmpegPath", settings.ffmpegPath);
    setValue("engine/conversionTimeoutMs", settings.conversionTimeoutMs);
}

void Config::setLoggingSettings(const LoggingSettings& settings) {
    setValue("logging/file", settings.logFilePath);
    setValue("logging/level", settings.level);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getCachePath() const {
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
}

QString Config::getTempPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/WhisperKit";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    QStringList paths = {
        getString("models/path", getDataPath() + "/models"),
        getString("engine/tempPath", getTempPath())
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            WHISPERKIT_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace WhisperKit
