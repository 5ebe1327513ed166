#pragma once

#include "coedit/replication/document.hpp"
#include "coedit/replication/update_store.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coedit::rooms {

using replication::Bytes;

using Frame = std::shared_ptr<const Bytes>;

// One connection attached to a room. Neither call may block; implementations
// queue the frames and write them on their own executor.
class RoomPeer {
public:
    virtual ~RoomPeer() = default;

    // Traffic from other peers. Implementations may drop a peer that falls
    // too far behind.
    virtual void send(Frame frame) = 0;

    // Frames the peer asked for (the sync handshake and history replay),
    // queued in order regardless of size.
    virtual void reply(std::vector<Frame> frames) = 0;
};

/**
 * A named collaborative document shared by every connection addressing it.
 *
 * The room owns the replicated state and its update store. Connections hand
 * it raw protocol frames; the room answers sync requests, persists new
 * updates, and fans them out to every attached peer.
 */
class Room {
public:
    Room(std::string name, std::unique_ptr<replication::ReplicatedDocument> document,
         std::unique_ptr<replication::UpdateStore> store);

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    const std::string& name() const { return name_; }

    // Hooks the document's update stream to peer broadcast. Idempotent.
    void start();
    bool started() const { return started_.load(); }

    // Replays stored history exactly once. A missing store is not an error;
    // any other load failure is logged and recorded, and the room becomes
    // ready regardless.
    void ensure_loaded();
    bool ready() const { return ready_.load(); }
    std::size_t load_attempts() const { return load_attempts_.load(); }
    std::optional<std::string> last_load_error() const;

    // Attaches a peer and sends it the opening sync step 1.
    void join(const std::shared_ptr<RoomPeer>& peer);
    void leave(const RoomPeer* peer);
    std::size_t peer_count() const;

    // Handles one binary protocol frame from `from`.
    // Throws ProtocolError when the frame cannot be decoded.
    void handle_frame(RoomPeer& from, const uint8_t* data, std::size_t size);

    // Applies an update; new updates are persisted and broadcast.
    bool apply_update(const Bytes& update);

    replication::ReplicatedDocument& document() { return *document_; }

private:
    void broadcast(const Frame& frame, const RoomPeer* except);

    std::string name_;
    std::unique_ptr<replication::ReplicatedDocument> document_;
    std::unique_ptr<replication::UpdateStore> store_;

    std::atomic<bool> started_{false};
    std::once_flag start_once_;

    std::atomic<bool> ready_{false};
    std::atomic<std::size_t> load_attempts_{0};
    mutable std::mutex load_mutex_;
    std::optional<std::string> last_load_error_;

    mutable std::mutex peers_mutex_;
    std::unordered_map<const RoomPeer*, std::weak_ptr<RoomPeer>> peers_;
};

} // namespace coedit::rooms
