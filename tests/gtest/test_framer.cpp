// =============================================================================
// Content-Length Framing Tests
// =============================================================================

#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "coedit/error.hpp"
#include "coedit/lsp/framer.hpp"

using namespace coedit;
using namespace coedit::lsp;

namespace {

boost::json::value sample_message() {
    return boost::json::parse(
        R"({"jsonrpc":"2.0","id":7,"method":"textDocument/hover",)"
        R"("params":{"textDocument":{"uri":"file:///tmp/x.lean"},"position":{"line":3,"character":14}}})");
}

} // namespace

TEST(FramerTest, EncodeStatesExactBodyLength) {
    const std::string framed = encode(boost::json::parse(R"({"method":"λ"})"));
    const std::string body = R"({"method":"λ"})";

    // Length counts bytes, not characters
    EXPECT_EQ(framed, "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
}

TEST(FramerTest, DecodeReturnsEncodedMessage) {
    std::istringstream in(encode(sample_message()));
    auto decoded = decode(in);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, sample_message());
}

TEST(FramerTest, DecodeReadsConsecutiveMessages) {
    const auto first = boost::json::parse(R"({"id":1})");
    const auto second = boost::json::parse(R"({"id":2,"result":null})");
    std::istringstream in(encode(first) + encode(second));

    EXPECT_EQ(decode(in).value(), first);
    EXPECT_EQ(decode(in).value(), second);
    EXPECT_FALSE(decode(in).has_value());
}

TEST(FramerTest, EmptyStreamIsEndOfStream) {
    std::istringstream in("");
    EXPECT_FALSE(decode(in).has_value());
}

TEST(FramerTest, HeaderNameIsCaseInsensitiveAndExtraHeadersIgnored) {
    const std::string body = R"({"id":3})";
    std::istringstream in("content-type: application/vscode-jsonrpc; charset=utf-8\r\n"
                          "CONTENT-LENGTH:   " + std::to_string(body.size()) + "\r\n\r\n" + body);
    auto decoded = decode(in);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->as_object().at("id").as_int64(), 3);
}

TEST(FramerTest, BareNewlinesAccepted) {
    std::istringstream in("Content-Length: 2\n\n{}");
    auto decoded = decode(in);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->is_object());
}

TEST(FramerTest, MissingLengthIsFramingError) {
    std::istringstream in("Content-Type: application/json\r\n\r\n{}");
    EXPECT_THROW(decode(in), FramingError);
}

TEST(FramerTest, TruncatedBodyIsFramingError) {
    std::istringstream in("Content-Length: 40\r\n\r\n{\"id\":1}");
    EXPECT_THROW(decode(in), FramingError);
}

TEST(FramerTest, MalformedBodyIsFramingError) {
    std::istringstream in("Content-Length: 5\r\n\r\n{oops");
    EXPECT_THROW(decode(in), FramingError);
}

TEST(FramerTest, StreamEndingInHeadersIsFramingError) {
    std::istringstream in("Content-Length: 5\r\n");
    EXPECT_THROW(decode(in), FramingError);
}

TEST(FramerTest, ParseContentLength) {
    EXPECT_EQ(parse_content_length("Content-Length: 42"), std::optional<std::size_t>(42));
    EXPECT_EQ(parse_content_length("content-length:0"), std::optional<std::size_t>(0));
    EXPECT_FALSE(parse_content_length("Content-Type: text/plain").has_value());
    EXPECT_FALSE(parse_content_length("garbage").has_value());
    EXPECT_THROW(parse_content_length("Content-Length: -1"), FramingError);
    EXPECT_THROW(parse_content_length("Content-Length: 12abc"), FramingError);
    EXPECT_THROW(parse_content_length("Content-Length:"), FramingError);
}

// =============================================================================
// FrameReader
// =============================================================================

TEST(FrameReaderTest, ByteAtATime) {
    const std::string framed = encode(sample_message());
    FrameReader reader;

    std::optional<boost::json::value> decoded;
    for (std::size_t i = 0; i < framed.size(); ++i) {
        EXPECT_FALSE(decoded.has_value()) << "message completed early at byte " << i;
        reader.feed(framed.data() + i, 1);
        decoded = reader.next();
    }
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, sample_message());
    EXPECT_TRUE(reader.at_boundary());
    EXPECT_NO_THROW(reader.finish());
}

TEST(FrameReaderTest, SeveralMessagesInOneChunk) {
    FrameReader reader;
    reader.feed(encode(boost::json::parse(R"({"id":1})")) + encode(boost::json::parse(R"({"id":2})")));

    auto first = reader.next();
    auto second = reader.next();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->as_object().at("id").as_int64(), 1);
    EXPECT_EQ(second->as_object().at("id").as_int64(), 2);
    EXPECT_FALSE(reader.next().has_value());
}

TEST(FrameReaderTest, PartialMessageAtEndOfStream) {
    FrameReader reader;
    reader.feed("Content-Length: 10\r\n\r\n{\"a\"");
    EXPECT_FALSE(reader.next().has_value());
    EXPECT_FALSE(reader.at_boundary());
    EXPECT_THROW(reader.finish(), FramingError);
}

TEST(FrameReaderTest, ErrorPoisonsReader) {
    FrameReader reader;
    reader.feed("X-Other: 1\r\n\r\n");
    EXPECT_THROW(reader.next(), FramingError);

    // Valid input afterwards does not recover the stream
    reader.feed(encode(boost::json::parse("{}")));
    EXPECT_THROW(reader.next(), FramingError);
}

TEST(FrameReaderTest, OverlongHeaderLineRejected) {
    FrameReader reader;
    reader.feed(std::string(9000, 'x'));
    EXPECT_THROW(reader.next(), FramingError);
}
