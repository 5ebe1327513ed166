#include "coedit/server/room_session.hpp"
#include "coedit/error.hpp"
#include "coedit/logging.hpp"

#include <boost/asio/post.hpp>

namespace coedit::server {

namespace http = beast::http;

RoomSession::RoomSession(net::ip::tcp::socket socket, std::shared_ptr<ServerContext> context,
                         std::string room_name)
    : ws_(std::move(socket)), context_(std::move(context)), room_name_(std::move(room_name)) {}

RoomSession::~RoomSession() {
    detach();
}

void RoomSession::run(http::request<http::string_body> request) {
    beast::get_lowest_layer(ws_).expires_never();

    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
    timeouts.keep_alive_pings = true;
    ws_.set_option(timeouts);
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "coedit");
    }));

    ws_.async_accept(request, beast::bind_front_handler(&RoomSession::on_accept, shared_from_this()));
}

void RoomSession::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_WARNING("Room '" + room_name_ + "': handshake failed: " + ec.message());
        return;
    }
    ws_.binary(true);

    // The first request for a room replays its history from disk.
    auto self = shared_from_this();
    net::post(*context_->blocking_pool, [self]() {
        try {
            auto room = self->context_->rooms->get_or_create_room(self->room_name_);
            net::post(self->ws_.get_executor(), [self, room]() { self->on_room_ready(room); });
        } catch (const std::exception& e) {
            LOG_ERROR("Room '" + self->room_name_ + "': " + e.what());
            net::post(self->ws_.get_executor(), [self]() {
                self->close(websocket::close_reason(websocket::close_code::internal_error));
            });
        }
    });
}

void RoomSession::on_room_ready(std::shared_ptr<rooms::Room> room) {
    room_ = std::move(room);
    room_->join(shared_from_this());
    LOG_DEBUG("Room '" + room_name_ + "': peer joined (" + std::to_string(room_->peer_count()) + " attached)");
    do_read();
}

void RoomSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&RoomSession::on_read, shared_from_this()));
}

void RoomSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
            LOG_DEBUG("Room '" + room_name_ + "': read failed: " + ec.message());
        }
        detach();
        return;
    }

    if (ws_.got_text()) {
        LOG_WARNING("Room '" + room_name_ + "': text frame on a binary protocol");
        close(websocket::close_reason(websocket::close_code::unknown_data));
        return;
    }

    const auto data = buffer_.cdata();
    try {
        room_->handle_frame(*this, static_cast<const uint8_t*>(data.data()), data.size());
    } catch (const ProtocolError& e) {
        LOG_WARNING("Room '" + room_name_ + "': dropping connection: " + e.message());
        close(websocket::close_reason(websocket::close_code::unknown_data));
        return;
    }
    buffer_.consume(buffer_.size());
    do_read();
}

void RoomSession::send(rooms::Frame frame) {
    net::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
        self->enqueue(std::move(frame), true);
    });
}

void RoomSession::reply(std::vector<rooms::Frame> frames) {
    net::post(ws_.get_executor(), [self = shared_from_this(), frames = std::move(frames)]() mutable {
        for (auto& frame : frames) {
            self->enqueue(std::move(frame), false);
        }
    });
}

void RoomSession::enqueue(rooms::Frame frame, bool broadcast) {
    if (closing_) {
        return;
    }
    if (broadcast) {
        if (queued_broadcasts_ >= kMaxQueuedFrames) {
            LOG_WARNING("Room '" + room_name_ + "': peer is not reading, disconnecting");
            close(websocket::close_reason(websocket::close_code::policy_error));
            return;
        }
        ++queued_broadcasts_;
    }
    queue_.push_back({std::move(frame), broadcast});
    if (!writing_) {
        do_write();
    }
}

void RoomSession::do_write() {
    writing_ = true;
    ws_.async_write(net::buffer(*queue_.front().frame),
                    beast::bind_front_handler(&RoomSession::on_write, shared_from_this()));
}

void RoomSession::on_write(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
        LOG_DEBUG("Room '" + room_name_ + "': write failed: " + ec.message());
        detach();
        return;
    }
    if (queue_.front().broadcast) {
        --queued_broadcasts_;
    }
    queue_.pop_front();

    if (closing_) {
        ws_.async_close(close_reason_, beast::bind_front_handler(&RoomSession::on_close, shared_from_this()));
        return;
    }
    if (!queue_.empty()) {
        do_write();
    }
}

void RoomSession::close(websocket::close_reason reason) {
    if (closing_) {
        return;
    }
    closing_ = true;
    close_reason_ = reason;
    detach();

    // With a frame in flight the close follows it from on_write.
    if (!writing_) {
        queue_.clear();
        queued_broadcasts_ = 0;
        ws_.async_close(close_reason_, beast::bind_front_handler(&RoomSession::on_close, shared_from_this()));
    }
}

void RoomSession::on_close(beast::error_code ec) {
    if (ec) {
        LOG_DEBUG("Room '" + room_name_ + "': close failed: " + ec.message());
    }
}

void RoomSession::detach() {
    if (room_) {
        room_->leave(this);
    }
}

} // namespace coedit::server
