#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace WhisperKit {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

// Until initialize() runs, messages go to spdlog's default console logger
Logger::Logger()
    : logger_(spdlog::default_logger()) {
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("whisperkit",
            spdlog::sinks_init_list{console_sink, file_sink});

        spdlog::drop("whisperkit");
        spdlog::register_logger(logger);
        logger_ = logger;

        setLevel(level);

        WHISPERKIT_INFO("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Console only
        logger_ = spdlog::get("whisperkit_fallback");
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt("whisperkit_fallback");
        }
        setLevel(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

Logger::Level Logger::level() const {
    return static_cast<Level>(logger_->level());
}

Logger::Level Logger::levelFromString(const std::string& name, Level fallback) {
    const auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && name != "off") {
        return fallback;
    }
    return static_cast<Level>(parsed);
}

} // namespace WhisperKit
