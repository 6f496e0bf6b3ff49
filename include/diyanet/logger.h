#pragma once
#include <string>
#include <memory>

namespace diyanet {

enum class LogLevel {
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3
};

// Accepts "debug", "info", "warning"/"warn", "error" (any case).
bool parse_log_level(const std::string& text, LogLevel& level);

class Logger {
public:
    virtual ~Logger() = default;
    
    virtual void debug(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    
    // Format string with variadic arguments (similar to printf)
    virtual void debugf(const char* format, ...) = 0;
    virtual void infof(const char* format, ...) = 0;
    virtual void warningf(const char* format, ...) = 0;
    virtual void errorf(const char* format, ...) = 0;

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_; }
    
    // Singleton access
    static Logger& instance();
    static void initialize(LogLevel level = LogLevel::Warning);

protected:
    LogLevel level_ = LogLevel::Warning;

private:
    static std::unique_ptr<Logger> instance_;
};

} // namespace diyanet
