#include <gtest/gtest.h>

#include <filesystem>
#include <unistd.h>

#include <boost/json.hpp>

#include "coedit/server/http_routes.hpp"

using namespace coedit;
using namespace coedit::server;

class HttpRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_dir_ = std::filesystem::temp_directory_path() / ("coedit_routes_" + std::to_string(::getpid()));
        std::filesystem::create_directories(data_dir_);

        process::ProcessSpec spec;
        spec.executable = "/bin/cat";
        spec.working_dir = "/tmp";

        context_.processes = std::make_shared<process::ProcessManager>(spec);
        context_.rooms = std::make_shared<rooms::RoomRegistry>(data_dir_);
        context_.metadata = {"file:///srv/project/Scratch.lean", "file:///srv/project"};
    }

    void TearDown() override {
        context_.processes->kill_all();
        std::filesystem::remove_all(data_dir_);
    }

    static Request get(const std::string& target) {
        Request request{http::verb::get, target, 11};
        request.keep_alive(true);
        return request;
    }

    static boost::json::object body_of(const Response& response) {
        return boost::json::parse(response.body()).as_object();
    }

    std::filesystem::path data_dir_;
    ServerContext context_;
};

TEST(RouteMatchTest, ParametrizedRoutes) {
    auto room = match_route("/yjs/lean-demo");
    EXPECT_EQ(room.kind, RouteKind::Room);
    EXPECT_EQ(room.parameter, "lean-demo");

    auto session = match_route("/lsp/abc-123?token=x");
    EXPECT_EQ(session.kind, RouteKind::Session);
    EXPECT_EQ(session.parameter, "abc-123");
}

TEST(RouteMatchTest, FixedRoutesIgnoreQuery) {
    EXPECT_EQ(match_route("/file-uri").kind, RouteKind::FileUri);
    EXPECT_EQ(match_route("/health?verbose=1").kind, RouteKind::Health);
}

TEST(RouteMatchTest, UnknownOrMalformedPaths) {
    EXPECT_EQ(match_route("/").kind, RouteKind::NotFound);
    EXPECT_EQ(match_route("/lsp/").kind, RouteKind::NotFound);
    EXPECT_EQ(match_route("/lsp/a/b").kind, RouteKind::NotFound);
    EXPECT_EQ(match_route("/yjs").kind, RouteKind::NotFound);
    EXPECT_EQ(match_route("/file-uri/extra").kind, RouteKind::NotFound);
}

TEST_F(HttpRoutesTest, FileUriReturnsDocumentMetadata) {
    auto response = handle_request(context_, get("/file-uri"));

    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::content_type], "application/json");
    auto body = body_of(response);
    EXPECT_EQ(body.at("fileUri").as_string(), "file:///srv/project/Scratch.lean");
    EXPECT_EQ(body.at("rootUri").as_string(), "file:///srv/project");
    EXPECT_TRUE(response.keep_alive());
}

TEST_F(HttpRoutesTest, HealthReportsCounters) {
    context_.processes->spawn("one");
    context_.rooms->get_or_create_room("room");

    auto body = body_of(handle_request(context_, get("/health")));
    EXPECT_EQ(body.at("status").as_string(), "healthy");
    EXPECT_EQ(body.at("sessions").to_number<int>(), 1);
    EXPECT_EQ(body.at("rooms").to_number<int>(), 1);
}

TEST_F(HttpRoutesTest, UnknownPathIsJson404) {
    auto response = handle_request(context_, get("/nope"));

    EXPECT_EQ(response.result(), http::status::not_found);
    auto body = body_of(response);
    EXPECT_EQ(body.at("error").as_string(), "Endpoint not found");
    EXPECT_EQ(body.at("code").to_number<int>(), 404);
}

TEST_F(HttpRoutesTest, WebSocketRoutesWithoutUpgrade) {
    auto response = handle_request(context_, get("/lsp/session"));
    EXPECT_EQ(response.result(), http::status::upgrade_required);
    EXPECT_EQ(body_of(response).at("code").to_number<int>(), 426);
}

TEST_F(HttpRoutesTest, NonGetIsRejected) {
    Request request{http::verb::post, "/health", 11};
    auto response = handle_request(context_, request);
    EXPECT_EQ(response.result(), http::status::method_not_allowed);
}

TEST(FileUriTest, AbsoluteNormalizedPath) {
    EXPECT_EQ(to_file_uri("/srv/project/./sub/../Scratch.lean"), "file:///srv/project/Scratch.lean");

    const auto relative = to_file_uri("Scratch.lean");
    EXPECT_EQ(relative.rfind("file:///", 0), 0u);
    EXPECT_NE(relative.find("/Scratch.lean"), std::string::npos);
}
