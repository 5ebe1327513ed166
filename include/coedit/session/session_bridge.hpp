#pragma once

#include "coedit/lsp/framer.hpp"
#include "coedit/process/process_manager.hpp"
#include "coedit/server/server_context.hpp"

#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace coedit::session {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = beast::websocket;

// Close reasons are limited to 123 bytes on the wire; longer text is cut at
// a UTF-8 character boundary.
websocket::close_reason make_close_reason(websocket::close_code code, const std::string& text);

/**
 * Binds one client WebSocket to one analysis process.
 *
 * Connecting -> Active once the handshake is done and the process runs.
 * While Active three loops run on the connection's strand:
 *
 *   inbound     client frame -> validate -> mirror -> framed write to stdin
 *   outbound    stdout bytes -> FrameReader -> text frame to the client
 *   diagnostic  stderr lines -> log
 *
 * The first loop to end records the close code and cancels the process
 * side (stdin, stdout, stderr). Once outbound and diagnostic have both
 * returned the process is killed (off the I/O threads) and the WebSocket is
 * closed with the recorded code; a still pending client read ends with
 * that close handshake.
 */
class SessionBridge : public std::enable_shared_from_this<SessionBridge> {
public:
    enum class State { Connecting, Active, Closing, Closed };
    enum class Loop { Inbound, Outbound, Diagnostic };

    SessionBridge(net::ip::tcp::socket socket, std::shared_ptr<server::ServerContext> context,
                  std::string session_id);
    ~SessionBridge();

    // Completes the WebSocket handshake for `request` and starts the session.
    void run(beast::http::request<beast::http::string_body> request);

    State state() const { return state_.load(); }
    const std::string& session_id() const { return session_id_; }

private:
    void on_accept(beast::error_code ec);
    void on_spawned(std::shared_ptr<process::AnalysisProcess> process);
    void on_spawn_failed(const std::string& reason);

    // Inbound loop
    void read_client();
    void on_client_read(beast::error_code ec, std::size_t bytes_transferred);
    void on_stdin_written(beast::error_code ec, std::size_t bytes_transferred);

    // Outbound loop
    void read_process();
    void on_process_read(beast::error_code ec, std::size_t bytes_transferred);
    void write_client();
    void on_client_written(beast::error_code ec, std::size_t bytes_transferred);

    // Diagnostic loop
    void read_stderr();
    void on_stderr_read(beast::error_code ec, std::size_t bytes_transferred);
    void log_stderr_line(const std::string& line) const;

    // First call records `reason` and cancels the process side; every loop
    // calls this exactly once when it ends.
    void loop_finished(Loop loop, websocket::close_reason reason);
    void kill_process();
    void close_client();
    void on_client_closed(beast::error_code ec);

    websocket::stream<beast::tcp_stream> ws_;
    std::shared_ptr<server::ServerContext> context_;
    std::string session_id_;
    std::atomic<State> state_{State::Connecting};

    std::shared_ptr<process::AnalysisProcess> process_;
    net::posix::stream_descriptor stdin_;
    net::posix::stream_descriptor stdout_;
    net::posix::stream_descriptor stderr_;

    beast::flat_buffer client_buffer_;
    std::string pending_stdin_;

    std::array<char, 8192> stdout_chunk_{};
    lsp::FrameReader frame_reader_;
    std::deque<std::string> outbound_;

    std::array<char, 4096> stderr_chunk_{};
    std::string stderr_line_;

    int process_loops_ = 0;
    bool stopping_ = false;
    websocket::close_reason close_reason_;
};

} // namespace coedit::session
