#include "coedit/server/http_server.hpp"
#include "coedit/error.hpp"
#include "coedit/logging.hpp"
#include "coedit/server/room_session.hpp"
#include "coedit/session/session_bridge.hpp"

#include <chrono>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/websocket.hpp>

namespace coedit::server {

namespace {

constexpr auto kRequestTimeout = std::chrono::seconds(30);
constexpr std::uint64_t kRequestBodyLimit = 64 * 1024;

} // namespace

// =============================================================================
// HttpSession
// =============================================================================

HttpSession::HttpSession(net::ip::tcp::socket socket, std::shared_ptr<ServerContext> context)
    : stream_(std::move(socket)), context_(std::move(context)) {}

void HttpSession::run() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    parser_.emplace();
    parser_->body_limit(kRequestBodyLimit);
    stream_.expires_after(kRequestTimeout);
    http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_DEBUG("HTTP read failed: " + ec.message());
        }
        return;
    }

    if (beast::websocket::is_upgrade(parser_->get())) {
        upgrade(parser_->release());
        return;
    }

    Response response;
    try {
        response = handle_request(*context_, parser_->get());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to handle HTTP request: " + std::string(e.what()));
        response = make_error_response(parser_->get(), http::status::internal_server_error,
                                       "Internal server error");
    }

    const bool keep_alive = response.keep_alive();
    response_ = std::make_shared<Response>(std::move(response));
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), keep_alive));
}

void HttpSession::upgrade(Request request) {
    const Route route = match_route(request.target());

    if (route.kind == RouteKind::Session) {
        LOG_INFO("Session connection for '" + route.parameter + "'");
        std::make_shared<session::SessionBridge>(stream_.release_socket(), context_, route.parameter)
            ->run(std::move(request));
        return;
    }

    if (route.kind == RouteKind::Room && rooms::RoomRegistry::is_valid_room_name(route.parameter)) {
        LOG_DEBUG("Room connection for '" + route.parameter + "'");
        std::make_shared<RoomSession>(stream_.release_socket(), context_, route.parameter)
            ->run(std::move(request));
        return;
    }

    const Response rejected = route.kind == RouteKind::Room
        ? make_error_response(request, http::status::bad_request, "Invalid room name")
        : make_error_response(request, http::status::not_found, "Endpoint not found");
    response_ = std::make_shared<Response>(rejected);
    response_->keep_alive(false);
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), false));
}

void HttpSession::on_write(bool keep_alive, beast::error_code ec, std::size_t) {
    response_.reset();
    if (ec) {
        LOG_DEBUG("HTTP write failed: " + ec.message());
        return;
    }
    if (!keep_alive) {
        do_close();
        return;
    }
    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
}

// =============================================================================
// HttpServer
// =============================================================================

HttpServer::HttpServer(net::io_context& ioc, std::shared_ptr<ServerContext> context)
    : ioc_(ioc), acceptor_(net::make_strand(ioc)), context_(std::move(context)) {}

void HttpServer::start(const std::string& host, uint16_t port) {
    beast::error_code ec;
    const auto fail = [&](const std::string& what) {
        COEDIT_THROW(ErrorCode::INTERNAL_ERROR,
                     "Cannot listen on " + host + ":" + std::to_string(port) + ": " + what + ": " + ec.message());
    };

    const auto address = net::ip::make_address(host, ec);
    if (ec) {
        throw ConfigError("Invalid listen address '" + host + "'", ec.message());
    }
    const net::ip::tcp::endpoint endpoint{address, port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) fail("open");
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) fail("set_option");
    acceptor_.bind(endpoint, ec);
    if (ec) fail("bind");
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) fail("listen");

    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    LOG_INFO("HTTP server listening on " + host + ":" + std::to_string(port_));
    do_accept();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
        LOG_INFO("HTTP server stopped accepting connections");
    });
}

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&HttpServer::on_accept, shared_from_this()));
}

void HttpServer::on_accept(beast::error_code ec, net::ip::tcp::socket socket) {
    if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
        return;
    }
    if (ec) {
        LOG_WARNING("Accept failed: " + ec.message());
    } else {
        std::make_shared<HttpSession>(std::move(socket), context_)->run();
    }
    do_accept();
}

} // namespace coedit::server
