#include "matchgraph/common/Logger.h"

#ifdef MATCHGRAPH_USE_SPDLOG
#include "matchgraph/backends/SpdlogBackend.h"
#else
#include "matchgraph/backends/DefaultBackend.h"
#endif

#include <cctype>
#include <mutex>

namespace matchgraph {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {
    std::mutex backendMutex;

    std::mutex captureMutex;
    bool captureEnabled = false;
    std::vector<std::string> capturedLines;

    std::string levelTag(LogLevel level) {
        return std::string("[") + levelName(level) + "] ";
    }

    std::unique_ptr<ILoggerBackend> makeDefaultBackend(
        [[maybe_unused]] const std::string& logDir,
        [[maybe_unused]] bool logToFile) {
#ifdef MATCHGRAPH_USE_SPDLOG
        return std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
        return std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = makeDefaultBackend(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::write(LogLevel level, const std::string& message,
                   const std::source_location& loc) {
    ensureBackend();
    std::string line = functionName(loc) + "() - " + message;
    backend_->log(level, line, loc);

    std::lock_guard<std::mutex> lock(captureMutex);
    if (captureEnabled) {
        capturedLines.push_back(levelTag(level) + line);
    }
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

// ===== Log Capture =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(captureMutex);
    captureEnabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(captureMutex);
    return captureEnabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(captureMutex);

    std::vector<std::string> result;
    for (const auto& line : capturedLines) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + (result.size() - maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex);
    capturedLines.clear();
}

std::string Logger::functionName(const std::source_location& loc) {
    // "std::vector<int> matchgraph::Foo::bar(int) const" -> "matchgraph::Foo::bar"
    std::string full = loc.function_name();
    size_t paren = full.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = full[i];
        if (c == '<') depth++;
        else if (c == '>') depth--;
        else if (c == ' ' && depth == 0) start = i + 1;
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = full[i];
        if (c == '<') depth++;
        else if (c == '>') depth--;
        else if (depth == 0 && c != '*' && c != '&' &&
                 !std::isspace(static_cast<unsigned char>(c))) name += c;
    }

    return name.empty() ? "Unknown" : name;
}

}  // namespace matchgraph
