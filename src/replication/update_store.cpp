#include "coedit/replication/update_store.hpp"
#include "coedit/error.hpp"

#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>

namespace coedit::replication {

namespace {

double now_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

} // namespace

UpdateStore::UpdateStore(std::filesystem::path path) : path_(std::move(path)) {}

void UpdateStore::append(const Bytes& update, const Bytes& metadata) {
    Encoder record;
    record.write_var_bytes(update);
    record.write_var_bytes(metadata);
    record.write_float64(now_seconds());

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    const bool fresh = !std::filesystem::exists(path_, ec);
    if (fresh && path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw RoomLoadError("Cannot create directory for update store: " + ec.message(),
                                path_.parent_path().string());
        }
    }

    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out) {
        throw RoomLoadError(std::string("Cannot open update store for append: ") + std::strerror(errno),
                            path_.string());
    }
    if (fresh) {
        out.write(kVersionLine, static_cast<std::streamsize>(std::strlen(kVersionLine)));
    }
    const Bytes& bytes = record.bytes();
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw RoomLoadError("Write to update store failed", path_.string());
    }
}

std::vector<StoredUpdate> UpdateStore::read_all() const {
    Bytes contents;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            std::error_code ec;
            if (!std::filesystem::exists(path_, ec)) {
                throw HistoryNotFound("No stored history", path_.string());
            }
            throw RoomLoadError(std::string("Cannot open update store: ") + std::strerror(errno),
                                path_.string());
        }
        contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    const std::size_t header_size = std::strlen(kVersionLine);
    if (contents.size() < header_size ||
        std::memcmp(contents.data(), kVersionLine, header_size) != 0) {
        throw RoomLoadError("Update store has an unrecognized header", path_.string());
    }

    std::vector<StoredUpdate> records;
    Decoder decoder(contents.data() + header_size, contents.size() - header_size);
    try {
        while (!decoder.empty()) {
            StoredUpdate record;
            record.update = decoder.read_var_bytes();
            record.metadata = decoder.read_var_bytes();
            record.timestamp = decoder.read_float64();
            records.push_back(std::move(record));
        }
    } catch (const ProtocolError& e) {
        throw RoomLoadError("Corrupt record " + std::to_string(records.size()) + " in update store: " +
                            e.message(), path_.string());
    }
    return records;
}

std::size_t UpdateStore::apply_updates(ReplicatedDocument& document) const {
    const std::vector<StoredUpdate> records = read_all();
    for (const auto& record : records) {
        document.apply_update(record.update);
    }
    return records.size();
}

} // namespace coedit::replication
