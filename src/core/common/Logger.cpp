#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace RepoGuard {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

// Library callers may log before initialize(); give them a console logger that is
// not registered globally, so initialize() can still claim the "repoguard" name.
Logger::Logger()
    : logger_(std::make_shared<spdlog::logger>(
          "repoguard_default", std::make_shared<spdlog::sinks::stderr_color_sink_mt>())) {
    logger_->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger_->set_level(spdlog::level::warn);
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (!logFilePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        spdlog::drop("repoguard");
        logger_ = std::make_shared<spdlog::logger>("repoguard", sinks.begin(), sinks.end());
        setLevel(level);
        spdlog::register_logger(logger_);

        REPOGUARD_DEBUG("Logger initialized (file: {})",
                        logFilePath.empty() ? std::string("none") : logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Keep the console-only default logger
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

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return Level::Trace;
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info") return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "critical") return Level::Critical;
    return fallback;
}

} // namespace RepoGuard
