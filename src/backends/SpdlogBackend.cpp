#include "matchgraph/backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace matchgraph {

namespace {
    constexpr const char* LOGGER_NAME = "matchgraph";
    constexpr const char* LOG_FILE_NAME = "matchgraph.log";
    constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
    constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    if (logToFile && !logDir.empty()) {
        logFilePath_ = (std::filesystem::path(logDir) / LOG_FILE_NAME).string();
    }

    // A previous backend instance may have registered the name already
    logger_ = spdlog::get(LOGGER_NAME);

    if (!logger_) {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_pattern(CONSOLE_PATTERN);
        sinks.push_back(consoleSink);

        if (!logFilePath_.empty()) {
            std::filesystem::create_directories(logDir);
            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFilePath_, true);
            fileSink->set_pattern(FILE_PATTERN);
            sinks.push_back(fileSink);
        }

        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(logger_);
    } else if (!logFilePath_.empty()) {
        // Reused logger keeps the sinks it was created with
        logFilePath_.clear();
    }

    logger_->set_level(spdlog::level::info);

    const char* envLevel = std::getenv("LOG_LEVEL");
    if (!envLevel) {
        envLevel = std::getenv("SPDLOG_LEVEL");
    }
    if (envLevel) {
        // Accepts trace/debug/info/warning/error/critical/off and spdlog's short forms
        auto level = spdlog::level::from_str(envLevel);
        if (level != spdlog::level::off || std::string(envLevel) == "off") {
            logger_->set_level(level);
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

}  // namespace matchgraph
