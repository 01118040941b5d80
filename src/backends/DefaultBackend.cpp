#include "matchgraph/backends/DefaultBackend.h"

#include <chrono>
#include <ctime>
#include <format>
#include <iostream>

namespace matchgraph {

DefaultBackend::DefaultBackend() : currentLevel_(LogLevel::Info) {}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    if (level < currentLevel_ || currentLevel_ == LogLevel::Off) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::clog << "[" << timestamp() << "] ["
              << levelToColor(level) << levelName(level) << "\033[0m] "
              << message << '\n';
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog.flush();
}

const char* DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
        default: return "";
    }
}

std::string DefaultBackend::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&t, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}",
                       local.tm_hour, local.tm_min, local.tm_sec,
                       static_cast<int>(ms.count()));
}

}  // namespace matchgraph
