#include "coedit/replication/sync_protocol.hpp"
#include "coedit/error.hpp"

#include <string>

namespace coedit::replication {

namespace {

Bytes encode_sync(SyncStep step, const Bytes& payload) {
    Encoder encoder;
    encoder.write_var_uint(static_cast<uint64_t>(MessageType::Sync));
    encoder.write_var_uint(static_cast<uint64_t>(step));
    encoder.write_var_bytes(payload);
    return encoder.take();
}

} // namespace

SyncMessage decode_message(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        throw ProtocolError("Empty message");
    }

    Decoder decoder(data, size);
    SyncMessage message;
    const uint64_t type = decoder.read_var_uint();
    message.type_number = type;

    switch (type) {
        case static_cast<uint64_t>(MessageType::Sync): {
            message.type = MessageType::Sync;
            const uint64_t step = decoder.read_var_uint();
            if (step > static_cast<uint64_t>(SyncStep::Update)) {
                throw ProtocolError("Unknown sync step " + std::to_string(step));
            }
            message.step = static_cast<SyncStep>(step);
            message.payload = decoder.read_var_bytes();
            break;
        }
        case static_cast<uint64_t>(MessageType::Awareness):
            message.type = MessageType::Awareness;
            message.payload = decoder.read_var_bytes();
            break;
        case static_cast<uint64_t>(MessageType::QueryAwareness):
            message.type = MessageType::QueryAwareness;
            break;
        default: {
            message.type = type == static_cast<uint64_t>(MessageType::Auth) ? MessageType::Auth
                                                                            : MessageType::Unknown;
            const std::size_t rest = decoder.remaining();
            message.payload.assign(data + decoder.offset(), data + decoder.offset() + rest);
            return message;
        }
    }

    if (!decoder.empty()) {
        throw ProtocolError(std::to_string(decoder.remaining()) + " trailing bytes after message");
    }
    return message;
}

Bytes encode_sync_step1(const Bytes& state_vector) {
    return encode_sync(SyncStep::Step1, state_vector);
}

Bytes encode_sync_step2(const Bytes& update) {
    return encode_sync(SyncStep::Step2, update);
}

Bytes encode_update(const Bytes& update) {
    return encode_sync(SyncStep::Update, update);
}

Bytes encode_awareness(const Bytes& payload) {
    Encoder encoder;
    encoder.write_var_uint(static_cast<uint64_t>(MessageType::Awareness));
    encoder.write_var_bytes(payload);
    return encoder.take();
}

Bytes empty_state_vector() {
    return Bytes{0};
}

Bytes empty_update() {
    // No structs, empty delete set.
    return Bytes{0, 0};
}

} // namespace coedit::replication
