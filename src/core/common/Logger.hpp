#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace WhisperKit {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    static Logger& instance();

    void initialize(const std::string& logFilePath = "whisperkit.log",
                    Level level = Level::Info);

    void setLevel(Level level);
    Level level() const;

    // Parses "trace", "debug", "info", "warn", "error", "critical" or "off"
    static Level levelFromString(const std::string& name, Level fallback = Level::Info);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        logger_->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        logger_->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        logger_->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        logger_->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        logger_->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        logger_->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger();
    std::shared_ptr<spdlog::logger> logger_;
};

#define WHISPERKIT_TRACE(...) WhisperKit::Logger::instance().trace(__VA_ARGS__)
#define WHISPERKIT_DEBUG(...) WhisperKit::Logger::instance().debug(__VA_ARGS__)
#define WHISPERKIT_INFO(...) WhisperKit::Logger::instance().info(__VA_ARGS__)
#define WHISPERKIT_WARN(...) WhisperKit::Logger::instance().warn(__VA_ARGS__)
#define WHISPERKIT_ERROR(...) WhisperKit::Logger::instance().error(__VA_ARGS__)
#define WHISPERKIT_CRITICAL(...) WhisperKit::Logger::instance().critical(__VA_ARGS__)

} // namespace WhisperKit
