#include "coedit/session/session_bridge.hpp"
#include "coedit/error.hpp"
#include "coedit/logging.hpp"
#include "coedit/lsp/message.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace coedit::session {

namespace http = beast::http;

namespace {

// Longest stderr line kept before it is logged in pieces.
constexpr std::size_t MAX_STDERR_LINE = 64 * 1024;

const char* loop_name(SessionBridge::Loop loop) {
    switch (loop) {
        case SessionBridge::Loop::Inbound: return "inbound";
        case SessionBridge::Loop::Outbound: return "outbound";
        case SessionBridge::Loop::Diagnostic: return "diagnostic";
    }
    return "unknown";
}

} // namespace

websocket::close_reason make_close_reason(websocket::close_code code, const std::string& text) {
    constexpr std::size_t max_reason = 123;
    std::size_t length = std::min(text.size(), max_reason);
    if (length < text.size()) {
        // Step back over UTF-8 continuation bytes so no character is split.
        while (length > 0 && (static_cast<unsigned char>(text[length]) & 0xC0) == 0x80) {
            --length;
        }
    }
    websocket::close_reason reason(code);
    reason.reason.assign(text.data(), length);
    return reason;
}

SessionBridge::SessionBridge(net::ip::tcp::socket socket, std::shared_ptr<server::ServerContext> context,
                             std::string session_id)
    : ws_(std::move(socket))
    , context_(std::move(context))
    , session_id_(std::move(session_id))
    , stdin_(ws_.get_executor())
    , stdout_(ws_.get_executor())
    , stderr_(ws_.get_executor()) {}

SessionBridge::~SessionBridge() {
    LOG_DEBUG("Session " + session_id_ + " released");
}

void SessionBridge::run(http::request<http::string_body> request) {
    // The websocket stream has its own timeouts.
    beast::get_lowest_layer(ws_).expires_never();

    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
    timeouts.keep_alive_pings = true;
    ws_.set_option(timeouts);
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "coedit");
    }));

    ws_.async_accept(request, beast::bind_front_handler(&SessionBridge::on_accept, shared_from_this()));
}

void SessionBridge::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_WARNING("Session " + session_id_ + ": handshake failed: " + ec.message());
        state_ = State::Closed;
        return;
    }

    // fork/exec stays off the I/O threads.
    auto self = shared_from_this();
    net::post(*context_->blocking_pool, [self]() {
        try {
            auto process = self->context_->processes->spawn(self->session_id_);
            net::post(self->ws_.get_executor(), [self, process]() { self->on_spawned(process); });
        } catch (const SpawnError& e) {
            LOG_ERROR("Session " + self->session_id_ + ": " + e.what());
            const std::string reason = e.message();
            net::post(self->ws_.get_executor(), [self, reason]() { self->on_spawn_failed(reason); });
        } catch (const std::exception& e) {
            LOG_ERROR("Session " + self->session_id_ + ": unexpected spawn failure: " + e.what());
            const std::string reason = e.what();
            net::post(self->ws_.get_executor(), [self, reason]() { self->on_spawn_failed(reason); });
        }
    });
}

void SessionBridge::on_spawned(std::shared_ptr<process::AnalysisProcess> process) {
    process_ = std::move(process);
    try {
        stdin_.assign(process_->duplicate_stdin_fd());
        stdout_.assign(process_->duplicate_stdout_fd());
        stderr_.assign(process_->duplicate_stderr_fd());
    } catch (const std::exception& e) {
        on_spawn_failed(e.what());
        return;
    }

    ws_.text(true);
    state_ = State::Active;
    process_loops_ = 2;
    LOG_INFO("Session " + session_id_ + " active (pid=" + std::to_string(process_->pid()) + ")");

    read_client();
    read_process();
    read_stderr();
}

void SessionBridge::on_spawn_failed(const std::string& reason) {
    stopping_ = true;
    state_ = State::Closing;
    close_reason_ = make_close_reason(websocket::close_code::internal_error, reason);
    if (process_) {
        kill_process();
    } else {
        close_client();
    }
}

// =============================================================================
// Inbound: client -> process
// =============================================================================

void SessionBridge::read_client() {
    ws_.async_read(client_buffer_, beast::bind_front_handler(&SessionBridge::on_client_read, shared_from_this()));
}

void SessionBridge::on_client_read(beast::error_code ec, std::size_t) {
    if (stopping_) {
        loop_finished(Loop::Inbound, {});
        return;
    }
    if (ec) {
        if (ec != websocket::error::closed) {
            LOG_DEBUG("Session " + session_id_ + ": client read failed: " + ec.message());
        }
        loop_finished(Loop::Inbound, websocket::close_code::normal);
        return;
    }

    const std::string text = beast::buffers_to_string(client_buffer_.data());
    client_buffer_.consume(client_buffer_.size());

    try {
        const lsp::ProtocolMessage message = lsp::ProtocolMessage::parse(text);
        message.validate();

        if (auto document = message.document_text()) {
            try {
                context_->mirror->write(*document);
            } catch (const MirrorWriteError& e) {
                LOG_ERROR("Session " + session_id_ + ": " + e.what());
            }
        }
        LOG_TRACE("Session " + session_id_ + " -> " + lsp::to_string(message.method()));
    } catch (const ValidationError& e) {
        LOG_WARNING("Session " + session_id_ + ": rejected message: " + e.message() +
                    (e.context().empty() ? "" : " (" + e.context() + ")"));
        loop_finished(Loop::Inbound, make_close_reason(websocket::close_code::policy_error, e.message()));
        return;
    }

    // The client's own bytes go to the process, never a re-serialization.
    pending_stdin_ = lsp::encode_body(text);
    net::async_write(stdin_, net::buffer(pending_stdin_),
                     beast::bind_front_handler(&SessionBridge::on_stdin_written, shared_from_this()));
}

void SessionBridge::on_stdin_written(beast::error_code ec, std::size_t) {
    if (stopping_) {
        loop_finished(Loop::Inbound, {});
        return;
    }
    if (ec) {
        LOG_WARNING("Session " + session_id_ + ": write to analysis process failed: " + ec.message());
        loop_finished(Loop::Inbound, make_close_reason(websocket::close_code::internal_error,
                                                   "Analysis process stopped reading"));
        return;
    }
    read_client();
}

// =============================================================================
// Outbound: process -> client
// =============================================================================

void SessionBridge::read_process() {
    stdout_.async_read_some(net::buffer(stdout_chunk_),
                            beast::bind_front_handler(&SessionBridge::on_process_read, shared_from_this()));
}

void SessionBridge::on_process_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (stopping_) {
        loop_finished(Loop::Outbound, {});
        return;
    }
    if (ec == net::error::eof) {
        try {
            frame_reader_.finish();
            loop_finished(Loop::Outbound, websocket::close_code::normal);
        } catch (const FramingError& e) {
            LOG_ERROR("Session " + session_id_ + ": " + e.what());
            loop_finished(Loop::Outbound, make_close_reason(websocket::close_code::internal_error, e.message()));
        }
        return;
    }
    if (ec) {
        LOG_WARNING("Session " + session_id_ + ": read from analysis process failed: " + ec.message());
        loop_finished(Loop::Outbound, make_close_reason(websocket::close_code::internal_error, ec.message()));
        return;
    }

    frame_reader_.feed(stdout_chunk_.data(), bytes_transferred);
    try {
        while (auto message = frame_reader_.next()) {
            outbound_.push_back(boost::json::serialize(*message));
        }
    } catch (const FramingError& e) {
        LOG_ERROR("Session " + session_id_ + ": " + e.what());
        loop_finished(Loop::Outbound, make_close_reason(websocket::close_code::internal_error, e.message()));
        return;
    }

    if (outbound_.empty()) {
        read_process();
    } else {
        write_client();
    }
}

void SessionBridge::write_client() {
    ws_.async_write(net::buffer(outbound_.front()),
                    beast::bind_front_handler(&SessionBridge::on_client_written, shared_from_this()));
}

void SessionBridge::on_client_written(beast::error_code ec, std::size_t) {
    if (stopping_) {
        loop_finished(Loop::Outbound, {});
        return;
    }
    if (ec) {
        LOG_DEBUG("Session " + session_id_ + ": client write failed: " + ec.message());
        loop_finished(Loop::Outbound, websocket::close_code::going_away);
        return;
    }

    outbound_.pop_front();
    if (outbound_.empty()) {
        read_process();
    } else {
        write_client();
    }
}

// =============================================================================
// Diagnostic: process stderr -> log
// =============================================================================

void SessionBridge::read_stderr() {
    stderr_.async_read_some(net::buffer(stderr_chunk_),
                            beast::bind_front_handler(&SessionBridge::on_stderr_read, shared_from_this()));
}

void SessionBridge::on_stderr_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (stopping_) {
        loop_finished(Loop::Diagnostic, {});
        return;
    }
    if (ec) {
        if (!stderr_line_.empty()) {
            log_stderr_line(stderr_line_);
            stderr_line_.clear();
        }
        if (ec != net::error::eof) {
            LOG_WARNING("Session " + session_id_ + ": stderr read failed: " + ec.message());
        }
        loop_finished(Loop::Diagnostic, websocket::close_code::normal);
        return;
    }

    stderr_line_.append(stderr_chunk_.data(), bytes_transferred);
    std::size_t newline;
    while ((newline = stderr_line_.find('\n')) != std::string::npos) {
        log_stderr_line(stderr_line_.substr(0, newline));
        stderr_line_.erase(0, newline + 1);
    }
    if (stderr_line_.size() > MAX_STDERR_LINE) {
        log_stderr_line(stderr_line_);
        stderr_line_.clear();
    }
    read_stderr();
}

void SessionBridge::log_stderr_line(const std::string& line) const {
    std::string trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == '\n')) {
        trimmed.pop_back();
    }
    LOG_INFO("[analysis-" + session_id_ + "] " + trimmed);
}

// =============================================================================
// Teardown
// =============================================================================

void SessionBridge::loop_finished(Loop loop, websocket::close_reason reason) {
    if (!stopping_) {
        stopping_ = true;
        state_ = State::Closing;
        close_reason_ = reason;
        LOG_INFO("Session " + session_id_ + ": " + loop_name(loop) + " loop ended, closing with code " +
                 std::to_string(static_cast<int>(reason.code)));

        // Only the process side is cancelled. A pending WebSocket read is
        // left alone and ends when the close handshake runs.
        beast::error_code ignored;
        stdin_.cancel(ignored);
        stdout_.cancel(ignored);
        stderr_.cancel(ignored);
    }

    // The inbound loop never holds the process; the last of the other two
    // starts the kill and then the close.
    if (loop != Loop::Inbound && --process_loops_ == 0) {
        kill_process();
    }
}

void SessionBridge::kill_process() {
    // Termination may wait out the grace period; keep it off the strand.
    auto self = shared_from_this();
    net::post(*context_->blocking_pool, [self]() {
        self->context_->processes->kill(self->session_id_);
        net::post(self->ws_.get_executor(), [self]() { self->close_client(); });
    });
}

void SessionBridge::close_client() {
    beast::error_code ignored;
    stdin_.close(ignored);
    stdout_.close(ignored);
    stderr_.close(ignored);

    if (!ws_.is_open()) {
        state_ = State::Closed;
        LOG_INFO("Session " + session_id_ + " closed");
        return;
    }
    ws_.async_close(close_reason_, beast::bind_front_handler(&SessionBridge::on_client_closed, shared_from_this()));
}

void SessionBridge::on_client_closed(beast::error_code ec) {
    if (ec) {
        LOG_DEBUG("Session " + session_id_ + ": close handshake failed: " + ec.message());
    }
    state_ = State::Closed;
    LOG_INFO("Session " + session_id_ + " closed");
}

} // namespace coedit::session
