#pragma once

#include "coedit/rooms/room.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace coedit::rooms {

/**
 * Owns every room for the lifetime of the server.
 *
 * get_or_create_room() is the only way in. Creation is atomic per name: the
 * lookup and insert happen under one lock, so concurrent first requests for
 * a new name all receive the same Room. Rooms are never removed.
 */
class RoomRegistry {
public:
    explicit RoomRegistry(std::filesystem::path data_dir);

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // Returns the started, loaded room. May block on the history replay the
    // first time a room is requested. Throws InvalidArgumentError for a name
    // that fails is_valid_room_name().
    std::shared_ptr<Room> get_or_create_room(const std::string& name);

    // Existing room or nullptr; never creates.
    std::shared_ptr<Room> find(const std::string& name) const;

    std::size_t size() const;

    // Update store location for a room name.
    std::filesystem::path store_path(const std::string& name) const;

    // Names become file names: [A-Za-z0-9._-], no leading dot, 1..128 chars.
    static bool is_valid_room_name(std::string_view name);

private:
    std::filesystem::path data_dir_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
};

} // namespace coedit::rooms
