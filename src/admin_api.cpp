#include "admin_api.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace monkeychat {

using json = nlohmann::json;

namespace {

HttpResponse json_response(int status, const json& body) {
    HttpResponse response;
    response.status = status;
    response.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    return response;
}

HttpResponse error_response(int status, const std::string& message) {
    return json_response(status, {{"error", message}});
}

std::string header_value(const HttpRequest& request, const std::string& name) {
    auto it = request.headers.find(name);
    return it == request.headers.end() ? "" : it->second;
}

} // namespace

AdminApi::AdminApi(SignalingHub& hub, const IdentityResolver& resolver)
    : hub_(hub)
    , resolver_(resolver)
{
    add_route("GET", "/health", [this](const HttpRequest& req) { return handle_health(req); });
    add_route("GET", "/rooms", [this](const HttpRequest& req) { return handle_list_rooms(req); });
    add_route("GET", "/rooms/mine", [this](const HttpRequest& req) { return handle_list_own_rooms(req); });
    add_route("POST", "/rooms/delete", [this](const HttpRequest& req) { return handle_delete_room(req); });
    add_route("GET", "/logs", [this](const HttpRequest& req) { return handle_logs(req); });
}

void AdminApi::add_route(const std::string& method, const std::string& path, RouteHandler handler) {
    routes_[method + " " + path] = std::move(handler);
}

HttpResponse AdminApi::handle(const HttpRequest& request) const {
    // CORS preflight
    if (request.method == "OPTIONS") {
        HttpResponse response;
        response.content_type = "text/plain";
        return response;
    }

    auto it = routes_.find(request.method + " " + request.path);
    if (it == routes_.end()) {
        Logger::warn("AdminApi", "404 Not Found: " + request.method + " " + request.path);
        return error_response(404, "Not Found");
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        Logger::error("AdminApi", "Error handling " + request.path + ": " + e.what());
        return error_response(500, "internal server error");
    }
}

HttpResponse AdminApi::handle_health(const HttpRequest& /*request*/) const {
    HttpResponse response;
    response.content_type = "text/plain";
    response.body = "OK";
    return response;
}

bool AdminApi::authenticate(const HttpRequest& request, Identity& requester, HttpResponse& rejection) const {
    std::string token = extract_bearer_token(header_value(request, "Authorization"));
    if (token.empty()) {
        rejection = error_response(401, "unauthorized: missing token");
        return false;
    }

    requester = resolver_.resolve(token);
    if (!is_authenticated(requester)) {
        rejection = error_response(401, "unauthorized: invalid token");
        return false;
    }
    return true;
}

HttpResponse AdminApi::rooms_response(const std::vector<RoomRecord>& records) const {
    json rooms = json::array();
    for (const auto& record : records) {
        rooms.push_back({
            {"id", record.id},
            {"createdBy", record.created_by},
            {"createdAt", record.created_at},
            {"members", hub_.registry().member_count(record.id)}
        });
    }
    return json_response(200, rooms);
}

HttpResponse AdminApi::handle_list_rooms(const HttpRequest& request) const {
    Identity requester;
    HttpResponse rejection;
    if (!authenticate(request, requester, rejection)) {
        return rejection;
    }

    RoomStore* store = hub_.store();
    if (!store) {
        return json_response(200, json::array());
    }
    return rooms_response(store->list_room_records());
}

HttpResponse AdminApi::handle_list_own_rooms(const HttpRequest& request) const {
    Identity requester;
    HttpResponse rejection;
    if (!authenticate(request, requester, rejection)) {
        return rejection;
    }

    RoomStore* store = hub_.store();
    if (!store) {
        return json_response(200, json::array());
    }
    return rooms_response(store->list_room_records_by_creator(as_authenticated(requester)->user_id));
}

HttpResponse AdminApi::handle_logs(const HttpRequest& request) const {
    Identity requester;
    HttpResponse rejection;
    if (!authenticate(request, requester, rejection)) {
        return rejection;
    }

    std::string path = Logger::get_log_file();
    if (path.empty()) {
        return error_response(500, "log file not configured");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::error("AdminApi", "Failed to read log file: " + path);
        return error_response(500, "failed to read log file");
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    HttpResponse response;
    response.content_type = "text/plain";
    response.body = contents.str();
    response.headers["Content-Disposition"] = "attachment; filename=monkeychat_server_logs.log";
    return response;
}

HttpResponse AdminApi::handle_delete_room(const HttpRequest& request) const {
    Identity requester;
    HttpResponse rejection;
    if (!authenticate(request, requester, rejection)) {
        return rejection;
    }

    std::string room_id;
    try {
        json body = json::parse(request.body);
        if (!body.is_object()) {
            return error_response(400, "invalid request body");
        }
        auto it = body.find("roomId");
        if (it != body.end() && it->is_string()) {
            room_id = it->get<std::string>();
        }
    } catch (const json::parse_error&) {
        return error_response(400, "invalid request body");
    }

    DeleteRoomResult result = hub_.delete_room(room_id, requester);
    switch (result) {
        case DeleteRoomResult::DELETED:
            return json_response(200, {{"message", "room deleted successfully"}});
        case DeleteRoomResult::INVALID_REQUEST:
            return error_response(400, "room ID is required");
        case DeleteRoomResult::UNAUTHORIZED:
            return error_response(401, to_string(result));
        case DeleteRoomResult::NOT_FOUND:
            return error_response(404, to_string(result));
        case DeleteRoomResult::FORBIDDEN:
            return error_response(403, to_string(result));
        case DeleteRoomResult::STORE_ERROR:
            return error_response(500, to_string(result));
    }
    return error_response(500, "internal server error");
}

} // namespace monkeychat
