#pragma once

#include "coedit/replication/document.hpp"
#include "coedit/replication/encoding.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

namespace coedit::replication {

struct StoredUpdate {
    Bytes update;
    Bytes metadata;
    double timestamp = 0.0;
};

/**
 * Append-only update log for one room.
 *
 * File layout: the line "VERSION:2", then one record per update:
 * varBytes(update) varBytes(metadata) float64(timestamp, seconds since epoch).
 * The file and its parent directory are created on the first append.
 */
class UpdateStore {
public:
    static constexpr const char* kVersionLine = "VERSION:2\n";

    explicit UpdateStore(std::filesystem::path path);

    // Throws RoomLoadError when the file cannot be written.
    void append(const Bytes& update, const Bytes& metadata = {});

    // Every stored record in write order.
    // Throws HistoryNotFound when the file does not exist and RoomLoadError
    // on a bad header or a truncated record.
    std::vector<StoredUpdate> read_all() const;

    // Replays the whole log into `document`; returns the number of records.
    std::size_t apply_updates(ReplicatedDocument& document) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace coedit::replication
