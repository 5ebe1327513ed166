#include "coedit/replication/encoding.hpp"
#include "coedit/error.hpp"

#include <cstring>

namespace coedit::replication {

void Encoder::write_var_uint(uint64_t value) {
    while (value > 0x7F) {
        buffer_.push_back(static_cast<uint8_t>(0x80 | (value & 0x7F)));
        value >>= 7;
    }
    buffer_.push_back(static_cast<uint8_t>(value));
}

void Encoder::write_var_bytes(const uint8_t* data, std::size_t size) {
    write_var_uint(size);
    write_raw(data, size);
}

void Encoder::write_float64(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int i = 0; i < 8; ++i) {
        buffer_.push_back(static_cast<uint8_t>(bits >> (8 * i)));
    }
}

void Encoder::write_raw(const uint8_t* data, std::size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

uint64_t Decoder::read_var_uint() {
    uint64_t value = 0;
    unsigned shift = 0;
    while (true) {
        if (offset_ >= size_) {
            throw ProtocolError("Unexpected end of data in varUint", "offset " + std::to_string(offset_));
        }
        const uint8_t byte = data_[offset_++];
        if (shift >= 64 || (shift == 63 && (byte & 0x7E) != 0)) {
            throw ProtocolError("varUint does not fit in 64 bits", "offset " + std::to_string(offset_));
        }
        value |= static_cast<uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) {
            return value;
        }
        shift += 7;
    }
}

Bytes Decoder::read_var_bytes() {
    const uint64_t length = read_var_uint();
    if (length > remaining()) {
        throw ProtocolError("varBytes length " + std::to_string(length) + " exceeds remaining " +
                            std::to_string(remaining()) + " bytes");
    }
    Bytes out(data_ + offset_, data_ + offset_ + length);
    offset_ += length;
    return out;
}

double Decoder::read_float64() {
    if (remaining() < 8) {
        throw ProtocolError("Unexpected end of data in float64", "offset " + std::to_string(offset_));
    }
    uint64_t bits = 0;
    for (int i = 0; i < 8; ++i) {
        bits |= static_cast<uint64_t>(data_[offset_ + i]) << (8 * i);
    }
    offset_ += 8;
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // namespace coedit::replication
