#pragma once
#include <string>
#include <functional>
#include <map>
#include <vector>
#include "identity.hpp"
#include "signaling_hub.hpp"

namespace monkeychat {

struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::map<std::string, std::string> headers;
};

using RouteHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * Plain-HTTP routes served next to the signaling socket:
 *   GET  /health        liveness probe
 *   GET  /rooms         every durable room
 *   GET  /rooms/mine    durable rooms created by the caller
 *   POST /rooms/delete  {"roomId": "..."}
 *   GET  /logs          current log file as a download
 * Everything except /health needs "Authorization: Bearer <token>".
 */
class AdminApi {
public:
    AdminApi(SignalingHub& hub, const IdentityResolver& resolver);

    AdminApi(const AdminApi&) = delete;
    AdminApi& operator=(const AdminApi&) = delete;

    void add_route(const std::string& method, const std::string& path, RouteHandler handler);
    HttpResponse handle(const HttpRequest& request) const;

private:
    // Resolves the bearer token; on failure fills `rejection` with the 401 to send
    bool authenticate(const HttpRequest& request, Identity& requester, HttpResponse& rejection) const;

    HttpResponse handle_health(const HttpRequest& request) const;
    HttpResponse handle_list_rooms(const HttpRequest& request) const;
    HttpResponse handle_list_own_rooms(const HttpRequest& request) const;
    HttpResponse handle_delete_room(const HttpRequest& request) const;
    HttpResponse handle_logs(const HttpRequest& request) const;

    HttpResponse rooms_response(const std::vector<RoomRecord>& records) const;

    SignalingHub& hub_;
    const IdentityResolver& resolver_;
    std::map<std::string, RouteHandler> routes_;   // "METHOD path"
};

} // namespace monkeychat
