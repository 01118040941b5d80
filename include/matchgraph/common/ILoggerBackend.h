#pragma once

#include <source_location>
#include <string>

namespace matchgraph {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Lower-case level name shared by the console backend and log capture
constexpr const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        default: return "off";
    }
}

/**
 * @brief Logger backend interface for dependency injection
 *
 * Implement this to route matchgraph diagnostics into a host application's
 * logging system:
 * @code
 * class HostLogger : public matchgraph::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host->setMinLevel(level); }
 *     void flush() override { host->flush(); }
 * };
 *
 * matchgraph::Logger::setBackend(std::make_unique<HostLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Pre-formatted message
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace matchgraph
