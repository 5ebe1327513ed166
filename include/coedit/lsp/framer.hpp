// =============================================================================
// framer.hpp - Content-Length framing for the analysis process streams
// =============================================================================
// Wire format (per message):
//
//     Content-Length: <n>\r\n
//     [other headers]\r\n
//     \r\n
//     <n bytes of UTF-8 JSON>
//
// Header names are matched case-insensitively, unrelated headers are ignored,
// and bare "\n" line endings are accepted on input.
// =============================================================================

#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json.hpp>

namespace coedit::lsp {

// Serialize a message and prefix it with its exact body length.
std::string encode(const boost::json::value& message);

// Frame an already serialized body byte for byte.
std::string encode_body(std::string_view body);

// Returns the declared length when `line` is a Content-Length header,
// std::nullopt for any other header. Throws FramingError when the header is
// present but its value is not a non-negative integer.
std::optional<std::size_t> parse_content_length(std::string_view line);

// Parse a message body. Throws FramingError on malformed JSON.
boost::json::value parse_body(std::string_view body);

// Blocking decode of one message. std::nullopt means the stream ended before
// any header line was read. Throws FramingError on a missing length header,
// a stream ending inside a message, or an unparseable body.
std::optional<boost::json::value> decode(std::istream& in);

/**
 * Incremental decoder for bytes arriving in arbitrary chunks.
 *
 * feed() appends raw bytes; next() yields complete messages in order.
 * After a FramingError the reader is poisoned and keeps throwing.
 */
class FrameReader {
public:
    void feed(const char* data, std::size_t size);
    void feed(std::string_view data) { feed(data.data(), data.size()); }

    // Next complete message, or std::nullopt when more bytes are needed.
    std::optional<boost::json::value> next();

    // True when no partial message is buffered (a clean place for EOF).
    bool at_boundary() const;

    // Call when the underlying stream reached EOF. Throws FramingError when
    // a partially received message is buffered.
    void finish() const;

private:
    enum class State { Headers, Body };

    bool take_line(std::string& line);

    std::string buffer_;
    State state_ = State::Headers;
    bool saw_header_line_ = false;
    std::optional<std::size_t> content_length_;
    bool failed_ = false;
};

} // namespace coedit::lsp
