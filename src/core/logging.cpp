#include "coedit/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

namespace coedit {

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    if (lowered == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    LogLevel level = LogLevel::INFO;
    mutable std::mutex mutex;

    Impl() {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        logger = std::make_shared<spdlog::logger>("coedit", console_sink);
        logger->set_level(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
    }

    void set_level(LogLevel new_level) {
        std::lock_guard<std::mutex> lock(mutex);
        level = new_level;
        switch (new_level) {
            case LogLevel::TRACE: logger->set_level(spdlog::level::trace); break;
            case LogLevel::DEBUG: logger->set_level(spdlog::level::debug); break;
            case LogLevel::INFO: logger->set_level(spdlog::level::info); break;
            case LogLevel::WARNING: logger->set_level(spdlog::level::warn); break;
            case LogLevel::ERROR: logger->set_level(spdlog::level::err); break;
            case LogLevel::CRITICAL: logger->set_level(spdlog::level::critical); break;
            case LogLevel::OFF: logger->set_level(spdlog::level::off); break;
        }
    }

    void set_output_file(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex);
        auto& sinks = logger->sinks();
        if (file_sink) {
            sinks.erase(std::remove(sinks.begin(), sinks.end(), file_sink), sinks.end());
            file_sink.reset();
        }
        if (filename.empty()) {
            return;
        }
        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }
};

std::shared_ptr<Logger> Logger::getInstance() {
    static std::shared_ptr<Logger> instance(new Logger());
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) {
    pImpl->logger->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->logger->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->logger->info(message);
}

void Logger::warning(const std::string& message) {
    pImpl->logger->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->logger->error(message);
}

void Logger::critical(const std::string& message) {
    pImpl->logger->critical(message);
}

void Logger::set_level(LogLevel level) {
    pImpl->set_level(level);
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->level;
}

void Logger::set_output_file(const std::string& filename) {
    pImpl->set_output_file(filename);
}

void initialize_logging(const std::string& level, const std::string& file) {
    auto logger = Logger::getInstance();
    logger->set_level(parse_log_level(level));
    logger->set_output_file(file);
}

} // namespace coedit
