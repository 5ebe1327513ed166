#pragma once

#include "coedit/server/http_routes.hpp"
#include "coedit/server/server_context.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace coedit::server {

namespace beast = boost::beast;
namespace net = boost::asio;

/**
 * One plain HTTP connection. Serves JSON endpoints with keep-alive and hands
 * the socket over to a RoomSession or SessionBridge on a WebSocket upgrade.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(net::ip::tcp::socket socket, std::shared_ptr<ServerContext> context);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void upgrade(Request request);
    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<ServerContext> context_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<Response> response_;
};

/**
 * Accepts TCP connections and starts an HttpSession for each one.
 * Every connection gets its own strand, so its handlers never run
 * concurrently with each other.
 */
class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(net::io_context& ioc, std::shared_ptr<ServerContext> context);

    // Binds and starts accepting. Port 0 picks an ephemeral port.
    // Throws CoeditException when the address cannot be bound.
    void start(const std::string& host, uint16_t port);

    // Stops accepting; established connections are left alone.
    void stop();

    bool is_running() const { return running_.load(); }
    uint16_t port() const { return port_; }

private:
    void do_accept();
    void on_accept(beast::error_code ec, net::ip::tcp::socket socket);

    net::io_context& ioc_;
    net::ip::tcp::acceptor acceptor_;
    std::shared_ptr<ServerContext> context_;
    std::atomic<bool> running_{false};
    uint16_t port_ = 0;
};

} // namespace coedit::server
