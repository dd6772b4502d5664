#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace WordFinder {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    void initialize(const std::string& logFilePath = "wordfinder.log",
                   Level level = Level::Info);

    void setLevel(Level level);

    // Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "critical").
    // Unknown names map to fallback.
    static Level levelFromString(const std::string& name, Level fallback = Level::Info);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        get()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        get()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        get()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        get()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        get()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        get()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Falls back to the spdlog default logger until initialize() has run
    spdlog::logger* get() const {
        return logger_ ? logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> logger_;
};

#define WORDFINDER_TRACE(...) WordFinder::Logger::instance().trace(__VA_ARGS__)
#define WORDFINDER_DEBUG(...) WordFinder::Logger::instance().debug(__VA_ARGS__)
#define WORDFINDER_INFO(...) WordFinder::Logger::instance().info(__VA_ARGS__)
#define WORDFINDER_WARN(...) WordFinder::Logger::instance().warn(__VA_ARGS__)
#define WORDFINDER_ERROR(...) WordFinder::Logger::instance().error(__VA_ARGS__)
#define WORDFINDER_CRITICAL(...) WordFinder::Logger::instance().critical(__VA_ARGS__)

} // namespace WordFinder
