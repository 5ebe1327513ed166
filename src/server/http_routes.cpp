#include "coedit/server/http_routes.hpp"
#include "coedit/logging.hpp"

namespace coedit::server {

namespace {

constexpr const char* kServerName = "coedit";

bool take_parameter(std::string_view path, std::string_view prefix, std::string& out) {
    if (path.substr(0, prefix.size()) != prefix) {
        return false;
    }
    const std::string_view rest = path.substr(prefix.size());
    if (rest.empty() || rest.find('/') != std::string_view::npos) {
        return false;
    }
    out.assign(rest.data(), rest.size());
    return true;
}

Response make_json_response(const Request& request, http::status status, std::string body) {
    Response res{status, request.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(request.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

} // namespace

Route match_route(std::string_view target) {
    const auto query = target.find('?');
    const std::string_view path = target.substr(0, query);

    Route route;
    if (take_parameter(path, "/yjs/", route.parameter)) {
        route.kind = RouteKind::Room;
    } else if (take_parameter(path, "/lsp/", route.parameter)) {
        route.kind = RouteKind::Session;
    } else if (path == "/file-uri") {
        route.kind = RouteKind::FileUri;
    } else if (path == "/health") {
        route.kind = RouteKind::Health;
    }
    return route;
}

std::string build_json_response(const boost::json::object& data) {
    return boost::json::serialize(data);
}

std::string build_error_response(const std::string& error_message, int status_code) {
    boost::json::object error;
    error["error"] = error_message;
    error["code"] = status_code;
    return boost::json::serialize(error);
}

Response make_error_response(const Request& request, http::status status, const std::string& message) {
    return make_json_response(request, status, build_error_response(message, static_cast<int>(status)));
}

Response handle_request(const ServerContext& context, const Request& request) {
    LOG_DEBUG("Handling HTTP request for path: " + std::string(request.target()));

    const Route route = match_route(request.target());
    switch (route.kind) {
        case RouteKind::FileUri:
        case RouteKind::Health:
            break;
        case RouteKind::Room:
        case RouteKind::Session:
            return make_error_response(request, http::status::upgrade_required,
                                       "WebSocket upgrade required");
        case RouteKind::NotFound:
            return make_error_response(request, http::status::not_found, "Endpoint not found");
    }

    if (request.method() != http::verb::get) {
        return make_error_response(request, http::status::method_not_allowed, "Method not allowed");
    }

    boost::json::object data;
    if (route.kind == RouteKind::FileUri) {
        data["fileUri"] = context.metadata.file_uri;
        data["rootUri"] = context.metadata.root_uri;
    } else {
        data["status"] = "healthy";
        data["sessions"] = context.processes ? context.processes->size() : 0;
        data["rooms"] = context.rooms ? context.rooms->size() : 0;
    }

    return make_json_response(request, http::status::ok, build_json_response(data));
}

} // namespace coedit::server
