#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace WordFinder {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    if (logger_) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        logger_ = std::make_shared<spdlog::logger>("wordfinder",
            spdlog::sinks_init_list{console_sink, file_sink});

        setLevel(level);
        spdlog::register_logger(logger_);

        WORDFINDER_INFO("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Console only when the log file cannot be opened
        logger_ = spdlog::get("wordfinder_fallback");
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt("wordfinder_fallback");
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

Logger::Level Logger::levelFromString(const std::string& name, Level fallback) {
    const auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        return fallback;
    }
    if (parsed > spdlog::level::critical) {
        return Level::Critical;
    }
    return static_cast<Level>(parsed);
}

} // namespace WordFinder
