#pragma once

#include "coedit/replication/encoding.hpp"

#include <cstdint>
#include <limits>

namespace coedit::replication {

// Top-level message types of the y-protocols framing.
enum class MessageType : uint64_t {
    Sync = 0,
    Awareness = 1,
    Auth = 2,
    QueryAwareness = 3,
    // Any other type number; decoded so it can be skipped, never encoded.
    Unknown = std::numeric_limits<uint64_t>::max()
};

enum class SyncStep : uint64_t {
    Step1 = 0,   // payload: state vector
    Step2 = 1,   // payload: update
    Update = 2   // payload: update
};

struct SyncMessage {
    MessageType type = MessageType::Sync;
    uint64_t type_number = 0;          // as read from the wire
    SyncStep step = SyncStep::Step1;   // meaningful for Sync only
    Bytes payload;                     // state vector, update, awareness blob,
                                       // or the undecoded rest of Auth/Unknown
};

// Sync and awareness messages are decoded strictly: an unknown sync step,
// truncated input or trailing bytes throw ProtocolError, as does empty input.
// Auth and unknown types only need a readable type number; their remaining
// bytes are kept as the payload.
SyncMessage decode_message(const uint8_t* data, std::size_t size);
inline SyncMessage decode_message(const Bytes& data) { return decode_message(data.data(), data.size()); }

Bytes encode_sync_step1(const Bytes& state_vector);
Bytes encode_sync_step2(const Bytes& update);
Bytes encode_update(const Bytes& update);
Bytes encode_awareness(const Bytes& payload);

// State vector of a document that has seen nothing (zero clients).
Bytes empty_state_vector();

// Update that changes nothing; answers step 1 for an empty room.
Bytes empty_update();

} // namespace coedit::replication
