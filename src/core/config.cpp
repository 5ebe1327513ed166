#include "coedit/config.hpp"
#include "coedit/error.hpp"
#include "coedit/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <thread>

namespace coedit {

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template<typename T>
T parse_number(const std::string& key, const std::string& text) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value > std::numeric_limits<T>::max()) {
            throw std::out_of_range(text);
        }
        return static_cast<T>(value);
    } catch (const std::exception&) {
        throw ConfigError("Invalid numeric value for " + key + ": '" + text + "'");
    }
}

} // namespace

Config default_config() {
    Config config;

    config.server.host = "0.0.0.0";
    config.server.port = 8080;
    config.server.threads = std::max(1u, std::thread::hardware_concurrency());

    config.analysis.executable = "lake";
    config.analysis.args = {"serve"};
    config.analysis.project_dir = "lean-project";
    config.analysis.kill_grace_ms = 5000;

    config.storage.data_dir = "data";

    config.logging.level = "info";
    config.logging.file = "";

    return config;
}

void apply_environment(Config& config) {
    if (const char* v = env_value("COEDIT_HOST")) config.server.host = v;
    if (const char* v = env_value("COEDIT_PORT")) config.server.port = parse_number<uint16_t>("COEDIT_PORT", v);
    if (const char* v = env_value("COEDIT_THREADS")) config.server.threads = parse_number<unsigned>("COEDIT_THREADS", v);
    if (const char* v = env_value("COEDIT_ANALYSIS_EXECUTABLE")) config.analysis.executable = v;
    if (const char* v = env_value("COEDIT_PROJECT_DIR")) config.analysis.project_dir = v;
    if (const char* v = env_value("COEDIT_DOCUMENT_PATH")) config.analysis.document_path = v;
    if (const char* v = env_value("COEDIT_DATA_DIR")) config.storage.data_dir = v;
    if (const char* v = env_value("COEDIT_LOG_LEVEL")) config.logging.level = v;
    if (const char* v = env_value("COEDIT_LOG_FILE")) config.logging.file = v;
}

Config load_config(const std::string& config_file) {
    Config config = default_config();
    config.config_file = config_file;

    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        try {
            YAML::Node yaml = YAML::LoadFile(config_file);

            if (yaml["server"]) {
                const auto& server = yaml["server"];
                if (server["host"]) config.server.host = server["host"].as<std::string>();
                if (server["port"]) config.server.port = server["port"].as<uint16_t>();
                if (server["threads"]) config.server.threads = server["threads"].as<unsigned>();
            }

            if (yaml["analysis"]) {
                const auto& analysis = yaml["analysis"];
                if (analysis["executable"]) config.analysis.executable = analysis["executable"].as<std::string>();
                if (analysis["args"]) config.analysis.args = analysis["args"].as<std::vector<std::string>>();
                if (analysis["project_dir"]) config.analysis.project_dir = analysis["project_dir"].as<std::string>();
                if (analysis["document_path"]) config.analysis.document_path = analysis["document_path"].as<std::string>();
                if (analysis["kill_grace_ms"]) config.analysis.kill_grace_ms = analysis["kill_grace_ms"].as<uint32_t>();
            }

            if (yaml["storage"]) {
                const auto& storage = yaml["storage"];
                if (storage["data_dir"]) config.storage.data_dir = storage["data_dir"].as<std::string>();
            }

            if (yaml["logging"]) {
                const auto& log = yaml["logging"];
                if (log["level"]) config.logging.level = log["level"].as<std::string>();
                if (log["file"]) config.logging.file = log["file"].as<std::string>();
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError("Failed to parse " + config_file + ": " + e.what(),
                              "load_config", "Check the YAML syntax and value types");
        }
    } else if (!config_file.empty()) {
        LOG_DEBUG("Config file " + config_file + " not found, using defaults");
    }

    apply_environment(config);

    if (config.analysis.executable.empty()) {
        throw ConfigError("analysis.executable must not be empty");
    }
    if (config.server.threads == 0) {
        config.server.threads = 1;
    }
    if (config.analysis.document_path.empty()) {
        config.analysis.document_path = config.analysis.project_dir / "src" / "Scratch.lean";
    }

    return config;
}

} // namespace coedit
