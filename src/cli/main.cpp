// =============================================================================
// coedit-server - collaborative editing server with per-session analysis
// =============================================================================
//
// Usage:
//   coedit-server [options]
//
// Options:
//   -c, --config PATH   YAML configuration file (default: config.yaml)
//   -H, --host HOST     Address to bind (overrides server.host)
//   -p, --port PORT     Port to listen on (overrides server.port)
//   -h, --help          Show this help
//
// Endpoints:
//   ws://HOST:PORT/yjs/{room}          shared document rooms
//   ws://HOST:PORT/lsp/{session_id}    analysis sessions
//   http://HOST:PORT/file-uri          document and project URIs
//   http://HOST:PORT/health            liveness and counters
//
// =============================================================================

#include "coedit/config.hpp"
#include "coedit/error.hpp"
#include "coedit/logging.hpp"
#include "coedit/server/http_server.hpp"
#include "coedit/server/server_context.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

namespace {

struct CommandLine {
    std::string config_file = "config.yaml";
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    bool help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH   YAML configuration file (default: config.yaml)\n"
              << "  -H, --host HOST     Address to bind\n"
              << "  -p, --port PORT     Port to listen on\n"
              << "  -h, --help          Show this help\n";
}

uint16_t parse_port(const std::string& text) {
    std::size_t consumed = 0;
    int value = -1;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != text.size() || value < 0 || value > 65535) {
        throw coedit::InvalidArgumentError("Invalid port '" + text + "'", "--port",
                                           "Use a number between 0 and 65535");
    }
    return static_cast<uint16_t>(value);
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.config_file = argv[++i];
        } else if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            options.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            options.port = parse_port(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            throw coedit::InvalidArgumentError("Unknown or incomplete option '" + arg + "'", "",
                                               "Run with --help for usage");
        }
    }
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const CommandLine options = parse_command_line(argc, argv);
        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        auto config = coedit::load_config(options.config_file);
        if (options.host) config.server.host = *options.host;
        if (options.port) config.server.port = *options.port;

        coedit::initialize_logging(config.logging.level, config.logging.file);
        LOG_INFO("Starting coedit server...");

        // A client or child vanishing mid-write must surface as EPIPE, not kill us.
        std::signal(SIGPIPE, SIG_IGN);

        std::filesystem::create_directories(config.storage.data_dir);
        LOG_INFO("Room storage: " + std::filesystem::absolute(config.storage.data_dir).string());

        auto context = coedit::server::make_server_context(config);
        LOG_INFO("Analysis command: " + config.analysis.executable + " (in " +
                 config.analysis.project_dir.string() + ")");
        LOG_INFO("Document: " + context->metadata.file_uri);

        boost::asio::io_context ioc{static_cast<int>(config.server.threads)};
        auto server = std::make_shared<coedit::server::HttpServer>(ioc, context);
        server->start(config.server.host, config.server.port);

        LOG_INFO("Room WebSocket:    ws://" + config.server.host + ":" + std::to_string(server->port()) + "/yjs/{room}");
        LOG_INFO("Session WebSocket: ws://" + config.server.host + ":" + std::to_string(server->port()) + "/lsp/{session_id}");

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal " + std::to_string(signal_number) + ", shutting down");
            server->stop();
            ioc.stop();
        });

        std::vector<std::thread> workers;
        workers.reserve(config.server.threads - 1);
        for (unsigned i = 1; i < config.server.threads; ++i) {
            workers.emplace_back([&ioc]() { ioc.run(); });
        }
        ioc.run();
        for (auto& worker : workers) {
            worker.join();
        }

        context->processes->kill_all();
        context->blocking_pool->join();
        LOG_INFO("coedit server stopped");
        return 0;

    } catch (const coedit::CoeditException& e) {
        LOG_CRITICAL(e.what());
        if (!e.suggestion().empty()) {
            std::cerr << e.suggestion() << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error in main: " + std::string(e.what()));
        return 1;
    }
}
