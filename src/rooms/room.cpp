#include "coedit/rooms/room.hpp"
#include "coedit/error.hpp"
#include "coedit/logging.hpp"
#include "coedit/replication/sync_protocol.hpp"

#include <algorithm>
#include <vector>

namespace coedit::rooms {

namespace rp = coedit::replication;

Room::Room(std::string name, std::unique_ptr<rp::ReplicatedDocument> document,
           std::unique_ptr<rp::UpdateStore> store)
    : name_(std::move(name)), document_(std::move(document)), store_(std::move(store)) {}

void Room::start() {
    std::call_once(start_once_, [this]() {
        document_->observe([this](const Bytes& update) {
            broadcast(std::make_shared<const Bytes>(rp::encode_update(update)), nullptr);
        });
        started_ = true;
        LOG_DEBUG("Room '" + name_ + "' started");
    });
}

void Room::ensure_loaded() {
    if (ready_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(load_mutex_);
    if (ready_.load()) {
        return;
    }

    ++load_attempts_;
    if (store_) {
        try {
            const std::size_t count = store_->apply_updates(*document_);
            LOG_INFO("Room '" + name_ + "' replayed " + std::to_string(count) + " stored updates");
        } catch (const HistoryNotFound&) {
            LOG_DEBUG("Room '" + name_ + "' has no stored history");
        } catch (const RoomLoadError& e) {
            LOG_ERROR("Room '" + name_ + "' history could not be loaded, continuing without it: " +
                      e.message() + " (" + e.context() + ")");
            last_load_error_ = e.message();
        }
    }
    ready_ = true;
}

std::optional<std::string> Room::last_load_error() const {
    std::lock_guard<std::mutex> lock(load_mutex_);
    return last_load_error_;
}

void Room::join(const std::shared_ptr<RoomPeer>& peer) {
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        peers_[peer.get()] = peer;
    }
    peer->reply({std::make_shared<const Bytes>(rp::encode_sync_step1(rp::empty_state_vector()))});
}

void Room::leave(const RoomPeer* peer) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    peers_.erase(peer);
}

std::size_t Room::peer_count() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peers_.size();
}

void Room::handle_frame(RoomPeer& from, const uint8_t* data, std::size_t size) {
    rp::SyncMessage message = rp::decode_message(data, size);

    switch (message.type) {
        case rp::MessageType::Sync:
            if (message.step == rp::SyncStep::Step1) {
                // The peer's state vector is not interpreted; it gets the full log.
                const std::vector<Bytes> state = document_->encode_state();
                std::vector<Frame> frames;
                frames.reserve(std::max<std::size_t>(1, state.size()));
                if (state.empty()) {
                    frames.push_back(std::make_shared<const Bytes>(rp::encode_sync_step2(rp::empty_update())));
                }
                for (const auto& update : state) {
                    frames.push_back(std::make_shared<const Bytes>(rp::encode_sync_step2(update)));
                }
                from.reply(std::move(frames));
            } else {
                apply_update(message.payload);
            }
            break;

        case rp::MessageType::Awareness:
            broadcast(std::make_shared<const Bytes>(data, data + size), &from);
            break;

        case rp::MessageType::QueryAwareness:
        case rp::MessageType::Auth:
            break;

        case rp::MessageType::Unknown:
            LOG_DEBUG("Room '" + name_ + "' ignoring message type " + std::to_string(message.type_number));
            break;
    }
}

bool Room::apply_update(const Bytes& update) {
    if (!document_->apply_update(update)) {
        return false;
    }
    if (store_) {
        try {
            store_->append(update);
        } catch (const RoomLoadError& e) {
            LOG_ERROR("Room '" + name_ + "' failed to persist update: " + e.message());
        }
    }
    return true;
}

void Room::broadcast(const Frame& frame, const RoomPeer* except) {
    std::vector<std::shared_ptr<RoomPeer>> targets;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        targets.reserve(peers_.size());
        for (auto it = peers_.begin(); it != peers_.end();) {
            if (auto peer = it->second.lock()) {
                if (it->first != except) {
                    targets.push_back(std::move(peer));
                }
                ++it;
            } else {
                it = peers_.erase(it);
            }
        }
    }
    for (const auto& peer : targets) {
        peer->send(frame);
    }
}

} // namespace coedit::rooms
