#pragma once

#include "coedit/server/server_context.hpp"

#include <string>
#include <string_view>

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

namespace coedit::server {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

enum class RouteKind {
    Room,       // /yjs/{room}
    Session,    // /lsp/{session_id}
    FileUri,    // /file-uri
    Health,     // /health
    NotFound
};

struct Route {
    RouteKind kind = RouteKind::NotFound;
    std::string parameter;
};

// Matches the path part of a request target; the query string is ignored.
// Path parameters are a single non-empty segment.
Route match_route(std::string_view target);

// Plain HTTP requests (anything that is not a WebSocket upgrade).
Response handle_request(const ServerContext& context, const Request& request);

std::string build_json_response(const boost::json::object& data);
std::string build_error_response(const std::string& error_message, int status_code);

// JSON error response carrying `status` both in the status line and body.
Response make_error_response(const Request& request, http::status status, const std::string& message);

} // namespace coedit::server
