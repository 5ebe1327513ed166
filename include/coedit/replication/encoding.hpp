// =============================================================================
// encoding.hpp - lib0 variable-length binary encoding
// =============================================================================
// The y-protocols wire format and the update store both use lib0 encoding:
//
//   varUint    7 bits per byte, least significant group first, high bit set
//              on every byte except the last
//   varBytes   varUint length followed by that many raw bytes
//   float64    8 bytes, little-endian IEEE 754 (update store only)
// =============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace coedit::replication {

using Bytes = std::vector<uint8_t>;

class Encoder {
public:
    void write_var_uint(uint64_t value);
    void write_var_bytes(const uint8_t* data, std::size_t size);
    void write_var_bytes(const Bytes& data) { write_var_bytes(data.data(), data.size()); }
    void write_float64(double value);
    void write_raw(const uint8_t* data, std::size_t size);

    const Bytes& bytes() const { return buffer_; }
    Bytes take() { return std::move(buffer_); }

private:
    Bytes buffer_;
};

// Reads from a borrowed buffer. Every read throws ProtocolError on truncated
// or oversized input instead of reading past the end.
class Decoder {
public:
    Decoder(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit Decoder(const Bytes& data) : Decoder(data.data(), data.size()) {}

    uint64_t read_var_uint();
    Bytes read_var_bytes();
    double read_float64();

    std::size_t remaining() const { return size_ - offset_; }
    bool empty() const { return offset_ == size_; }
    std::size_t offset() const { return offset_; }

private:
    const uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
};

} // namespace coedit::replication
