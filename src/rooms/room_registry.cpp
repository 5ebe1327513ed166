#include "coedit/rooms/room_registry.hpp"
#include "coedit/error.hpp"
#include "coedit/logging.hpp"

#include <cctype>

namespace coedit::rooms {

namespace rp = coedit::replication;

namespace {

constexpr std::size_t kMaxRoomNameLength = 128;

} // namespace

RoomRegistry::RoomRegistry(std::filesystem::path data_dir) : data_dir_(std::move(data_dir)) {}

bool RoomRegistry::is_valid_room_name(std::string_view name) {
    if (name.empty() || name.size() > kMaxRoomNameLength || name.front() == '.') {
        return false;
    }
    for (char c : name) {
        const bool allowed = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

std::filesystem::path RoomRegistry::store_path(const std::string& name) const {
    return data_dir_ / (name + ".ystore");
}

std::shared_ptr<Room> RoomRegistry::get_or_create_room(const std::string& name) {
    COEDIT_CHECK_ARGUMENT(is_valid_room_name(name), "Invalid room name '" + name + "'");

    std::shared_ptr<Room> room;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rooms_.find(name);
        if (it == rooms_.end()) {
            room = std::make_shared<Room>(name, std::make_unique<rp::UpdateLogDocument>(),
                                          std::make_unique<rp::UpdateStore>(store_path(name)));
            rooms_.emplace(name, room);
            LOG_INFO("Created room '" + name + "'");
        } else {
            room = it->second;
        }
    }

    // Both are idempotent; the room serializes its own one-time load.
    room->start();
    room->ensure_loaded();
    return room;
}

std::shared_ptr<Room> RoomRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(name);
    return it == rooms_.end() ? nullptr : it->second;
}

std::size_t RoomRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

} // namespace coedit::rooms
