#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace monkeychat {

using json = nlohmann::json;

// Wire envelope: {"event": "...", "roomId": "...", "payload": <opaque JSON>}
enum class EventType {
    JOIN,
    LEAVE,
    OFFER,
    ANSWER,
    ICE_CANDIDATE,

    // Server-originated
    JOINED,
    USER_JOINED,
    USER_LEFT
};

const char* to_string(EventType event);
std::optional<EventType> event_from_string(const std::string& tag);

// Events a client may send
bool is_client_event(EventType event);
// Events forwarded verbatim to the rest of the room
bool is_relay_event(EventType event);

struct SignalingMessage {
    EventType event;
    std::string room_id;
    std::string raw;     // exact inbound bytes, forwarded unmodified for relay events
    json payload;        // kept for join/leave only; null otherwise or when absent
};

enum class ParseStatus {
    OK,
    MALFORMED_JSON,
    NOT_AN_OBJECT,
    MISSING_EVENT,
    UNKNOWN_EVENT,
    MISSING_ROOM_ID
};

const char* to_string(ParseStatus status);

struct ParseResult {
    ParseStatus status = ParseStatus::MALFORMED_JSON;
    std::optional<SignalingMessage> message;
    std::string detail;

    bool ok() const { return status == ParseStatus::OK; }
};

ParseResult parse_message(const std::string& raw);

// "userName" of a join/leave payload, or "" when absent, empty, or not a string
std::string extract_user_name(const json& payload);

std::string make_joined_message(const std::string& room_id);
std::string make_user_joined_message(const std::string& room_id, const std::string& user_name);
std::string make_user_left_message(const std::string& room_id, const std::string& user_name);

} // namespace monkeychat
