#pragma once

#include "matchgraph/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace matchgraph {

/**
 * @brief Process-wide logging facade
 *
 * The backend is spdlog when built with MATCHGRAPH_USE_SPDLOG, a plain
 * stderr writer (std::clog) otherwise, or whatever the host injects with
 * setBackend().
 * Capture mode keeps a copy of every line in memory so tests can assert on
 * diagnostics without scraping stderr.
 *
 * @code
 * matchgraph::Logger::enableCapture(true);
 * LOG_DEBUG("{} layers, {} crossings", layerCount, crossings);
 * auto lines = matchgraph::Logger::getCapturedLogs("crossings");
 * @endcode
 */
class Logger {
public:
    /// Replace the backend (ownership transferred)
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Install the default backend if none is set (console only)
    static void initialize();

    /// Install the default backend with an optional log file in logDir
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /**
     * @brief Captured lines, optionally filtered
     * @param pattern Substring filter (empty = all lines)
     * @param maxLines Keep only the last N matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc);
    static void ensureBackend();
    static std::string functionName(const std::source_location& loc);
};

}  // namespace matchgraph

#define LOG_TRACE(...) matchgraph::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) matchgraph::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  matchgraph::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  matchgraph::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) matchgraph::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
