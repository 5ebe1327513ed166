#include "coedit/server/server_context.hpp"
#include "coedit/logging.hpp"

#include <algorithm>

namespace coedit::server {

std::string to_file_uri(const std::filesystem::path& path) {
    return "file://" + std::filesystem::absolute(path).lexically_normal().generic_string();
}

DocumentMetadata compute_metadata(const AnalysisConfig& analysis) {
    DocumentMetadata metadata;
    metadata.file_uri = to_file_uri(analysis.document_path);
    metadata.root_uri = to_file_uri(analysis.project_dir);
    return metadata;
}

std::shared_ptr<ServerContext> make_server_context(const Config& config) {
    process::ProcessSpec spec;
    spec.executable = config.analysis.executable;
    spec.args = config.analysis.args;
    spec.working_dir = config.analysis.project_dir;
    spec.kill_grace = std::chrono::milliseconds(config.analysis.kill_grace_ms);

    auto context = std::make_shared<ServerContext>();
    context->processes = std::make_shared<process::ProcessManager>(std::move(spec));
    context->rooms = std::make_shared<rooms::RoomRegistry>(config.storage.data_dir);
    context->mirror = std::make_shared<lsp::DocumentMirror>(config.analysis.document_path);
    context->metadata = compute_metadata(config.analysis);

    // Terminations can each wait out the full grace period, so keep a few
    // threads even on small machines.
    const std::size_t pool_threads = std::max<std::size_t>(4, config.server.threads);
    context->blocking_pool = std::make_shared<boost::asio::thread_pool>(pool_threads);

    LOG_DEBUG("Document URI: " + context->metadata.file_uri);
    LOG_DEBUG("Project root URI: " + context->metadata.root_uri);
    return context;
}

} // namespace coedit::server
