#include "coedit/lsp/framer.hpp"
#include "coedit/error.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <istream>

namespace coedit::lsp {

namespace {

// Upper bounds that keep a misbehaving process from exhausting memory.
constexpr std::size_t MAX_HEADER_LINE = 8 * 1024;
constexpr std::size_t MAX_BODY_SIZE = 256 * 1024 * 1024;

std::string_view trim(std::string_view text) {
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::string encode(const boost::json::value& message) {
    return encode_body(boost::json::serialize(message));
}

std::string encode_body(std::string_view body) {
    std::string framed = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    framed.append(body.data(), body.size());
    return framed;
}

std::optional<std::size_t> parse_content_length(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    if (!iequals(trim(line.substr(0, colon)), "content-length")) {
        return std::nullopt;
    }

    const std::string_view value = trim(line.substr(colon + 1));
    std::size_t length = 0;
    const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
        throw FramingError("Invalid Content-Length value: '" + std::string(value) + "'");
    }
    if (length > MAX_BODY_SIZE) {
        throw FramingError("Content-Length " + std::to_string(length) + " exceeds limit");
    }
    return length;
}

boost::json::value parse_body(std::string_view body) {
    boost::system::error_code ec;
    boost::json::value message = boost::json::parse(boost::json::string_view(body.data(), body.size()), ec);
    if (ec) {
        throw FramingError("Message body is not valid JSON: " + ec.message());
    }
    return message;
}

std::optional<boost::json::value> decode(std::istream& in) {
    std::optional<std::size_t> content_length;
    bool read_any_line = false;
    std::string line;

    while (true) {
        if (!std::getline(in, line)) {
            if (!read_any_line) {
                return std::nullopt;
            }
            throw FramingError("Stream ended inside message headers");
        }
        read_any_line = true;

        const std::string_view header = trim(line);
        if (header.empty()) {
            break;
        }
        if (auto length = parse_content_length(header)) {
            content_length = length;
        }
    }

    if (!content_length) {
        throw FramingError("Message headers carry no Content-Length");
    }

    std::string body(*content_length, '\0');
    in.read(body.data(), static_cast<std::streamsize>(body.size()));
    if (static_cast<std::size_t>(in.gcount()) != body.size()) {
        throw FramingError("Stream ended after " + std::to_string(in.gcount()) + " of " +
                           std::to_string(body.size()) + " body bytes");
    }
    return parse_body(body);
}

// =============================================================================
// FrameReader
// =============================================================================

void FrameReader::feed(const char* data, std::size_t size) {
    buffer_.append(data, size);
}

bool FrameReader::take_line(std::string& line) {
    const auto newline = buffer_.find('\n');
    if (newline == std::string::npos) {
        if (buffer_.size() > MAX_HEADER_LINE) {
            throw FramingError("Header line exceeds " + std::to_string(MAX_HEADER_LINE) + " bytes");
        }
        return false;
    }
    line.assign(buffer_, 0, newline);
    buffer_.erase(0, newline + 1);
    return true;
}

std::optional<boost::json::value> FrameReader::next() {
    if (failed_) {
        throw FramingError("Frame reader already failed");
    }

    try {
        while (state_ == State::Headers) {
            std::string line;
            if (!take_line(line)) {
                return std::nullopt;
            }

            const std::string_view header = trim(line);
            if (header.empty()) {
                if (!content_length_) {
                    throw FramingError("Message headers carry no Content-Length");
                }
                state_ = State::Body;
                break;
            }

            saw_header_line_ = true;
            if (auto length = parse_content_length(header)) {
                content_length_ = length;
            }
        }

        if (buffer_.size() < *content_length_) {
            return std::nullopt;
        }

        const std::string body = buffer_.substr(0, *content_length_);
        buffer_.erase(0, *content_length_);
        state_ = State::Headers;
        saw_header_line_ = false;
        content_length_.reset();

        return parse_body(body);
    } catch (const FramingError&) {
        failed_ = true;
        throw;
    }
}

bool FrameReader::at_boundary() const {
    return state_ == State::Headers && !saw_header_line_ && buffer_.empty();
}

void FrameReader::finish() const {
    if (!at_boundary()) {
        throw FramingError("Stream ended inside a message");
    }
}

} // namespace coedit::lsp
