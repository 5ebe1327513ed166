#pragma once

#include "coedit/rooms/room.hpp"
#include "coedit/server/server_context.hpp"

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace coedit::server {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = beast::websocket;

/**
 * One WebSocket attached to a room.
 *
 * Binary frames go to Room::handle_frame(); frames the room sends back are
 * queued and written one at a time on the connection's strand. A frame the
 * protocol cannot decode closes this connection with 1003 and leaves the
 * room untouched.
 */
class RoomSession : public rooms::RoomPeer, public std::enable_shared_from_this<RoomSession> {
public:
    // Queued broadcast frames beyond this mean the client stopped reading.
    // Replies to the client's own requests do not count.
    static constexpr std::size_t kMaxQueuedFrames = 4096;

    RoomSession(net::ip::tcp::socket socket, std::shared_ptr<ServerContext> context, std::string room_name);
    ~RoomSession() override;

    void run(beast::http::request<beast::http::string_body> request);

    // Thread-safe; may be called from any connection's handler.
    void send(rooms::Frame frame) override;
    void reply(std::vector<rooms::Frame> frames) override;

private:
    void on_accept(beast::error_code ec);
    void on_room_ready(std::shared_ptr<rooms::Room> room);

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void enqueue(rooms::Frame frame, bool broadcast);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    void close(websocket::close_reason reason);
    void on_close(beast::error_code ec);
    void detach();

    websocket::stream<beast::tcp_stream> ws_;
    std::shared_ptr<ServerContext> context_;
    std::string room_name_;
    std::shared_ptr<rooms::Room> room_;

    beast::flat_buffer buffer_;
    struct Outgoing {
        rooms::Frame frame;
        bool broadcast;
    };
    std::deque<Outgoing> queue_;
    std::size_t queued_broadcasts_ = 0;
    bool writing_ = false;
    bool closing_ = false;
    websocket::close_reason close_reason_;
};

} // namespace coedit::server
