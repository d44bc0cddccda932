#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace RepoGuard {

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

    // Console sink on stderr, plus a rotating file sink when logFilePath is not empty.
    // Call once at startup, before any worker threads log.
    void initialize(const std::string& logFilePath = std::string(),
                    Level level = Level::Warn);

    void setLevel(Level level);
    Level level() const;

    // Accepts trace/debug/info/warn/error/critical, case-insensitive
    static Level parseLevel(const std::string& name, Level fallback);

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

#define REPOGUARD_TRACE(...) RepoGuard::Logger::instance().trace(__VA_ARGS__)
#define REPOGUARD_DEBUG(...) RepoGuard::Logger::instance().debug(__VA_ARGS__)
#define REPOGUARD_INFO(...) RepoGuard::Logger::instance().info(__VA_ARGS__)
#define REPOGUARD_WARN(...) RepoGuard::Logger::instance().warn(__VA_ARGS__)
#define REPOGUARD_ERROR(...) RepoGuard::Logger::instance().error(__VA_ARGS__)
#define REPOGUARD_CRITICAL(...) RepoGuard::Logger::instance().critical(__VA_ARGS__)

} // namespace RepoGuard
