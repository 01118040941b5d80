#pragma once

#include "matchgraph/common/ILoggerBackend.h"
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace matchgraph {

/**
 * @brief spdlog backend writing to stderr and an optional log file
 *
 * stdout is left to layout output (the CLI prints result JSON there).
 * With logToFile, every line is also appended to logDir/matchgraph.log.
 * LOG_LEVEL or SPDLOG_LEVEL overrides the initial info level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    /// Path of the file sink, empty when logging to the console only
    const std::string& logFilePath() const { return logFilePath_; }

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::string logFilePath_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace matchgraph
