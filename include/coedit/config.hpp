#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace coedit {

struct ServerConfig {
    std::string host;
    uint16_t port;
    unsigned threads;
};

// How the per-session analysis process is launched.
struct AnalysisConfig {
    std::string executable;
    std::vector<std::string> args;
    std::filesystem::path project_dir;
    std::filesystem::path document_path;
    uint32_t kill_grace_ms;
};

struct StorageConfig {
    std::filesystem::path data_dir;
};

struct LoggingConfig {
    std::string level;
    std::string file;
};

struct Config {
    ServerConfig server;
    AnalysisConfig analysis;
    StorageConfig storage;
    LoggingConfig logging;
    std::string config_file;
};

// Built-in defaults, before any file or environment is consulted.
Config default_config();

// Load configuration from a YAML file, then apply COEDIT_* environment
// overrides. A missing file yields defaults; a malformed one throws ConfigError.
Config load_config(const std::string& config_file = "config.yaml");

// Applies COEDIT_* environment variables on top of an existing configuration.
void apply_environment(Config& config);

} // namespace coedit
