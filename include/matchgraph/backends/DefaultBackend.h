#pragma once

#include "matchgraph/common/ILoggerBackend.h"
#include <mutex>

namespace matchgraph {

/**
 * @brief stderr logger with no external dependencies
 *
 * Timestamped (HH:MM:SS.mmm), ANSI-coloured by level, serialized with a
 * mutex. Used when the library is built without spdlog.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    static const char* levelToColor(LogLevel level);
    static std::string timestamp();
};

}  // namespace matchgraph
