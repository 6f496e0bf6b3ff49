#include "diyanet/logger.h"
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <memory>
#include <vector>

namespace diyanet {

std::unique_ptr<Logger> Logger::instance_;

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") {
        level = LogLevel::Debug;
    } else if (lowered == "info") {
        level = LogLevel::Info;
    } else if (lowered == "warning" || lowered == "warn") {
        level = LogLevel::Warning;
    } else if (lowered == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

namespace {

std::string vformat(const char* format, va_list args) {
    char buffer[256];
    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(buffer, sizeof(buffer), format, copy);
    va_end(copy);
    if (needed < 0) {
        return format;
    }
    if (static_cast<size_t>(needed) < sizeof(buffer)) {
        return std::string(buffer, static_cast<size_t>(needed));
    }
    // URLs and page excerpts do not fit the stack buffer
    std::vector<char> large(static_cast<size_t>(needed) + 1);
    vsnprintf(large.data(), large.size(), format, args);
    return std::string(large.data(), static_cast<size_t>(needed));
}

} // namespace

// Everything goes to stderr, stdout carries the tool's results
class StdLogger : public Logger {
public:
    void debug(const std::string& message) override {
        write(LogLevel::Debug, "[DEBUG] ", message);
    }

    void info(const std::string& message) override {
        write(LogLevel::Info, "[INFO] ", message);
    }

    void warning(const std::string& message) override {
        write(LogLevel::Warning, "[WARNING] ", message);
    }

    void error(const std::string& message) override {
        write(LogLevel::Error, "[ERROR] ", message);
    }

    void debugf(const char* format, ...) override {
        if (!enabled(LogLevel::Debug)) return;
        va_list args;
        va_start(args, format);
        std::string message = vformat(format, args);
        va_end(args);
        debug(message);
    }

    void infof(const char* format, ...) override {
        if (!enabled(LogLevel::Info)) return;
        va_list args;
        va_start(args, format);
        std::string message = vformat(format, args);
        va_end(args);
        info(message);
    }

    void warningf(const char* format, ...) override {
        if (!enabled(LogLevel::Warning)) return;
        va_list args;
        va_start(args, format);
        std::string message = vformat(format, args);
        va_end(args);
        warning(message);
    }

    void errorf(const char* format, ...) override {
        if (!enabled(LogLevel::Error)) return;
        va_list args;
        va_start(args, format);
        std::string message = vformat(format, args);
        va_end(args);
        error(message);
    }

private:
    void write(LogLevel level, const char* prefix, const std::string& message) {
        if (!enabled(level)) return;
        std::cerr << prefix << message << std::endl;
    }
};

void Logger::initialize(LogLevel level) {
    instance_ = std::make_unique<StdLogger>();
    instance_->set_level(level);
}

Logger& Logger::instance() {
    if (!instance_) {
        initialize();
    }
    return *instance_;
}

} // namespace diyanet
