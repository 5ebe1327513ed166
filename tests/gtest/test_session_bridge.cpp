// =============================================================================
// End-to-end tests: HTTP server, session bridge and room sessions
// =============================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>

#include "coedit/config.hpp"
#include "coedit/replication/sync_protocol.hpp"
#include "coedit/replication/update_store.hpp"
#include "coedit/server/http_server.hpp"
#include "coedit/session/session_bridge.hpp"

using namespace coedit;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace websocket = beast::websocket;

using Client = websocket::stream<net::ip::tcp::socket>;

namespace {

constexpr const char* kDidOpen =
    R"({"jsonrpc":"2.0","method":"textDocument/didOpen","params":{"textDocument":)"
    R"({"uri":"file:///tmp/x.lean","languageId":"lean4","version":1,"text":"-- draft"}}})";

constexpr const char* kDidChange =
    R"({"jsonrpc":"2.0","method":"textDocument/didChange","params":{"textDocument":)"
    R"({"uri":"file:///tmp/x.lean","version":2},"contentChanges":[{"text":"theorem t : True := trivial"}]}})";

constexpr const char* kBadUri =
    R"({"jsonrpc":"2.0","method":"textDocument/didOpen","params":{"textDocument":)"
    R"({"uri":"not-a-uri","languageId":"lean4","version":1,"text":""}}})";

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

// Reads until the server closes; returns the close code it sent.
int read_until_close(Client& ws) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    for (;;) {
        ws.read(buffer, ec);
        if (ec) break;
        buffer.consume(buffer.size());
    }
    EXPECT_EQ(ec, websocket::error::closed) << ec.message();
    return static_cast<int>(ws.reason().code);
}

template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

} // namespace

class ServerEndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("coedit_e2e_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        ioc_.stop();
        for (auto& t : threads_) t.join();
        if (context_) {
            context_->processes->kill_all();
            context_->blocking_pool->join();
        }
        std::filesystem::remove_all(dir_);
    }

    void start_server(const std::string& executable, std::vector<std::string> args = {}) {
        Config config = default_config();
        config.server.host = "127.0.0.1";
        config.server.port = 0;
        config.server.threads = 2;
        config.analysis.executable = executable;
        config.analysis.args = std::move(args);
        config.analysis.project_dir = dir_;
        config.analysis.document_path = dir_ / "Scratch.lean";
        config.analysis.kill_grace_ms = 1000;
        config.storage.data_dir = dir_ / "rooms";

        context_ = server::make_server_context(config);
        server_ = std::make_shared<server::HttpServer>(ioc_, context_);
        server_->start(config.server.host, 0);
        for (int i = 0; i < 2; ++i) {
            threads_.emplace_back([this]() { ioc_.run(); });
        }
    }

    std::unique_ptr<Client> connect(const std::string& target) {
        auto ws = std::make_unique<Client>(client_ioc_);
        ws->next_layer().connect({net::ip::make_address("127.0.0.1"), server_->port()});
        ws->handshake("127.0.0.1", target);
        return ws;
    }

    std::filesystem::path dir_;
    net::io_context ioc_;
    net::io_context client_ioc_;
    std::vector<std::thread> threads_;
    std::shared_ptr<server::ServerContext> context_;
    std::shared_ptr<server::HttpServer> server_;
};

// =============================================================================
// Session bridge
// =============================================================================

TEST_F(ServerEndToEndTest, MessagesRoundTripThroughProcess) {
    start_server("/bin/cat");
    auto ws = connect("/lsp/echo-session");
    ws->text(true);

    ws->write(net::buffer(std::string(kDidOpen)));

    beast::flat_buffer buffer;
    ws->read(buffer);
    EXPECT_TRUE(ws->got_text());
    EXPECT_EQ(boost::json::parse(beast::buffers_to_string(buffer.data())), boost::json::parse(kDidOpen));
    EXPECT_EQ(read_file(dir_ / "Scratch.lean"), "-- draft");

    ws->close(websocket::close_code::normal);
}

TEST_F(ServerEndToEndTest, FullDidChangeUpdatesMirror) {
    start_server("/bin/cat");
    auto ws = connect("/lsp/mirror-session");
    ws->text(true);

    ws->write(net::buffer(std::string(kDidOpen)));
    ws->write(net::buffer(std::string(kDidChange)));

    beast::flat_buffer buffer;
    ws->read(buffer);
    buffer.consume(buffer.size());
    ws->read(buffer);

    EXPECT_EQ(boost::json::parse(beast::buffers_to_string(buffer.data())), boost::json::parse(kDidChange));
    EXPECT_EQ(read_file(dir_ / "Scratch.lean"), "theorem t : True := trivial");
    ws->close(websocket::close_code::normal);
}

TEST_F(ServerEndToEndTest, InvalidUriClosesWithPolicyViolation) {
    start_server("/bin/cat");
    auto ws = connect("/lsp/bad-session");
    ws->text(true);
    ASSERT_TRUE(eventually([this]() { return context_->processes->contains("bad-session"); }));

    ws->write(net::buffer(std::string(kBadUri)));

    EXPECT_EQ(read_until_close(*ws), 1008);
    // The process is gone before the close frame is sent.
    EXPECT_FALSE(context_->processes->contains("bad-session"));
}

TEST_F(ServerEndToEndTest, InvalidJsonClosesWithPolicyViolation) {
    start_server("/bin/cat");
    auto ws = connect("/lsp/json-session");
    ws->text(true);

    ws->write(net::buffer(std::string("{not json")));
    EXPECT_EQ(read_until_close(*ws), 1008);
}

TEST_F(ServerEndToEndTest, ClientDisconnectKillsProcess) {
    start_server("/bin/cat");
    auto ws = connect("/lsp/leaving-session");
    ASSERT_TRUE(eventually([this]() { return context_->processes->contains("leaving-session"); }));
    const pid_t first = context_->processes->spawn("leaving-session")->pid();

    ws->close(websocket::close_code::normal);
    ASSERT_TRUE(eventually([this]() { return !context_->processes->contains("leaving-session"); }));

    auto again = connect("/lsp/leaving-session");
    ASSERT_TRUE(eventually([this]() { return context_->processes->contains("leaving-session"); }));
    EXPECT_NE(context_->processes->spawn("leaving-session")->pid(), first);
    again->close(websocket::close_code::normal);
}

TEST_F(ServerEndToEndTest, SpawnFailureClosesWithInternalError) {
    start_server("/nonexistent/coedit-analysis-server");
    auto ws = connect("/lsp/doomed-session");

    EXPECT_EQ(read_until_close(*ws), 1011);
    EXPECT_FALSE(context_->processes->contains("doomed-session"));
}

TEST_F(ServerEndToEndTest, ProcessExitClosesNormally) {
    start_server("/bin/sh", {"-c", "echo 'loading project' >&2; exit 0"});
    auto ws = connect("/lsp/short-session");

    EXPECT_EQ(read_until_close(*ws), 1000);
}

TEST_F(ServerEndToEndTest, MalformedProcessOutputClosesWithInternalError) {
    start_server("/bin/sh", {"-c", "printf 'Content-Length: x\\r\\n\\r\\n'; exec sleep 5"});
    auto ws = connect("/lsp/garbled-session");

    EXPECT_EQ(read_until_close(*ws), 1011);
    const std::string reason(ws->reason().reason.data(), ws->reason().reason.size());
    EXPECT_NE(reason.find("Content-Length"), std::string::npos) << reason;
    EXPECT_FALSE(context_->processes->contains("garbled-session"));
}

TEST_F(ServerEndToEndTest, ProcessExitWhileClientIdleSendsCloseFrame) {
    start_server("/bin/sh", {"-c", "exec sleep 0.2"});
    auto ws = connect("/lsp/idle-session");
    ws->text(true);

    // The client never writes; the close must still arrive as a frame.
    EXPECT_EQ(read_until_close(*ws), 1000);
    EXPECT_FALSE(context_->processes->contains("idle-session"));
}

// =============================================================================
// Plain HTTP and rooms
// =============================================================================

TEST_F(ServerEndToEndTest, FileUriOverHttp) {
    start_server("/bin/cat");

    net::ip::tcp::socket socket(client_ioc_);
    socket.connect({net::ip::make_address("127.0.0.1"), server_->port()});
    http::request<http::empty_body> request{http::verb::get, "/file-uri", 11};
    request.set(http::field::host, "127.0.0.1");
    http::write(socket, request);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);

    EXPECT_EQ(response.result(), http::status::ok);
    auto body = boost::json::parse(response.body()).as_object();
    EXPECT_EQ(body.at("fileUri").as_string(), context_->metadata.file_uri);
    EXPECT_EQ(body.at("rootUri").as_string(), context_->metadata.root_uri);
}

TEST_F(ServerEndToEndTest, InvalidRoomNameDeclined) {
    start_server("/bin/cat");
    try {
        connect("/yjs/.hidden");
        FAIL() << "Expected the upgrade to be declined";
    } catch (const beast::system_error& e) {
        EXPECT_EQ(e.code(), websocket::error::upgrade_declined);
    }
}

TEST_F(ServerEndToEndTest, RoomPeersShareUpdates) {
    using namespace coedit::replication;
    start_server("/bin/cat");

    auto alice = connect("/yjs/shared-room");
    auto bob = connect("/yjs/shared-room");
    alice->binary(true);
    bob->binary(true);

    beast::flat_buffer buffer;
    alice->read(buffer);
    EXPECT_EQ(beast::buffers_to_string(buffer.data()), std::string("\x00\x00\x01\x00", 4));
    buffer.consume(buffer.size());
    bob->read(buffer);
    buffer.consume(buffer.size());

    const Bytes update = encode_update(Bytes{4, 2});
    alice->write(net::buffer(update));

    bob->read(buffer);
    const std::string received = beast::buffers_to_string(buffer.data());
    EXPECT_EQ(received, std::string(update.begin(), update.end()));

    alice->close(websocket::close_code::normal);
    bob->close(websocket::close_code::normal);
}

TEST_F(ServerEndToEndTest, RoomWithLongHistoryCanBeJoined) {
    using namespace coedit::replication;
    constexpr int kUpdates = 5000;
    {
        UpdateStore seed(dir_ / "rooms" / "busy.ystore");
        for (int i = 0; i < kUpdates; ++i) {
            seed.append(Bytes{static_cast<uint8_t>(i & 0xFF), static_cast<uint8_t>(i >> 8)});
        }
    }
    start_server("/bin/cat");

    auto ws = connect("/yjs/busy");
    ws->binary(true);
    beast::flat_buffer buffer;
    ws->read(buffer);   // server's own step 1
    buffer.consume(buffer.size());

    const Bytes request = encode_sync_step1(empty_state_vector());
    ws->write(net::buffer(request));

    for (int i = 0; i < kUpdates; ++i) {
        beast::error_code ec;
        ws->read(buffer, ec);
        ASSERT_FALSE(ec) << "after " << i << " frames: " << ec.message();
        const std::string frame = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        ASSERT_EQ(frame.substr(0, 2), std::string("\x00\x01", 2));
    }
    EXPECT_TRUE(ws->is_open());

    ws->close(websocket::close_code::normal);
}

TEST(CloseReasonTest, TruncatedAtCharacterBoundary) {
    std::string text(122, 'a');
    text += "\xC3\xA9";   // two-byte character straddling the limit
    auto reason = session::make_close_reason(websocket::close_code::policy_error, text);

    EXPECT_EQ(reason.code, websocket::close_code::policy_error);
    EXPECT_EQ(reason.reason.size(), 122u);

    auto short_reason = session::make_close_reason(websocket::close_code::normal, "bye");
    EXPECT_EQ(std::string(short_reason.reason.data(), short_reason.reason.size()), "bye");
}
