#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <vector>

namespace Scribe {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
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

        spdlog::drop("scribe");
        logger_ = std::make_shared<spdlog::logger>("scribe", sinks.begin(), sinks.end());
        setLevel(level);
        spdlog::register_logger(logger_);

        SCRIBE_INFO("Logger initialized with file: {}",
                    logFilePath.empty() ? std::string("<console>") : logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop("scribe_fallback");
        logger_ = spdlog::stderr_color_mt("scribe_fallback");
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        std::call_once(fallbackOnce_, [this]() {
            logger_ = spdlog::get("scribe_console");
            if (!logger_) {
                logger_ = spdlog::stderr_color_mt("scribe_console");
            }
        });
    }
    return logger_;
}

} // namespace Scribe
