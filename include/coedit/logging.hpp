#pragma once

#include <memory>
#include <string>

namespace coedit {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

// Parses "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
// (case-insensitive). Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static std::shared_ptr<Logger> getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;

    // Adds a file sink next to the console sink. An empty name removes it.
    void set_output_file(const std::string& filename);

    ~Logger();

private:
    Logger();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Applies level and file in one call, used by main() after config load.
void initialize_logging(const std::string& level, const std::string& file);

// Convenience macros
#define LOG_TRACE(msg) coedit::Logger::getInstance()->trace(msg)
#define LOG_DEBUG(msg) coedit::Logger::getInstance()->debug(msg)
#define LOG_INFO(msg) coedit::Logger::getInstance()->info(msg)
#define LOG_WARNING(msg) coedit::Logger::getInstance()->warning(msg)
#define LOG_ERROR(msg) coedit::Logger::getInstance()->error(msg)
#define LOG_CRITICAL(msg) coedit::Logger::getInstance()->critical(msg)

} // namespace coedit
