#pragma once

#include "coedit/config.hpp"
#include "coedit/lsp/document_mirror.hpp"
#include "coedit/process/process_manager.hpp"
#include "coedit/rooms/room_registry.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>

namespace coedit::server {

// Answer of GET /file-uri; fixed for the lifetime of the server.
struct DocumentMetadata {
    std::string file_uri;
    std::string root_uri;
};

// "file://" followed by the absolute, lexically normalized path.
std::string to_file_uri(const std::filesystem::path& path);

DocumentMetadata compute_metadata(const AnalysisConfig& analysis);

/**
 * Everything a connection handler needs, shared by all connections.
 *
 * blocking_pool runs work that must stay off the I/O threads: process
 * launch and termination, and the first load of a room's history.
 */
struct ServerContext {
    std::shared_ptr<process::ProcessManager> processes;
    std::shared_ptr<rooms::RoomRegistry> rooms;
    std::shared_ptr<lsp::DocumentMirror> mirror;
    DocumentMetadata metadata;
    std::shared_ptr<boost::asio::thread_pool> blocking_pool;
};

std::shared_ptr<ServerContext> make_server_context(const Config& config);

} // namespace coedit::server
