#include "signaling_message.hpp"

namespace monkeychat {

namespace {

std::string make_presence_message(EventType event, const std::string& room_id, const std::string& user_name) {
    json message = {
        {"event", to_string(event)},
        {"roomId", room_id},
        {"payload", {{"userName", user_name}}}
    };
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

const char* to_string(EventType event) {
    switch (event) {
        case EventType::JOIN: return "join";
        case EventType::LEAVE: return "leave";
        case EventType::OFFER: return "offer";
        case EventType::ANSWER: return "answer";
        case EventType::ICE_CANDIDATE: return "ice-candidate";
        case EventType::JOINED: return "joined";
        case EventType::USER_JOINED: return "user-joined";
        case EventType::USER_LEFT: return "user-left";
    }
    return "unknown";
}

std::optional<EventType> event_from_string(const std::string& tag) {
    if (tag == "join") return EventType::JOIN;
    if (tag == "leave") return EventType::LEAVE;
    if (tag == "offer") return EventType::OFFER;
    if (tag == "answer") return EventType::ANSWER;
    if (tag == "ice-candidate") return EventType::ICE_CANDIDATE;
    if (tag == "joined") return EventType::JOINED;
    if (tag == "user-joined") return EventType::USER_JOINED;
    if (tag == "user-left") return EventType::USER_LEFT;
    return std::nullopt;
}

bool is_client_event(EventType event) {
    switch (event) {
        case EventType::JOIN:
        case EventType::LEAVE:
        case EventType::OFFER:
        case EventType::ANSWER:
        case EventType::ICE_CANDIDATE:
            return true;
        case EventType::JOINED:
        case EventType::USER_JOINED:
        case EventType::USER_LEFT:
            return false;
    }
    return false;
}

bool is_relay_event(EventType event) {
    return event == EventType::OFFER ||
           event == EventType::ANSWER ||
           event == EventType::ICE_CANDIDATE;
}

const char* to_string(ParseStatus status) {
    switch (status) {
        case ParseStatus::OK: return "ok";
        case ParseStatus::MALFORMED_JSON: return "malformed JSON";
        case ParseStatus::NOT_AN_OBJECT: return "envelope is not an object";
        case ParseStatus::MISSING_EVENT: return "missing event";
        case ParseStatus::UNKNOWN_EVENT: return "unknown event";
        case ParseStatus::MISSING_ROOM_ID: return "missing roomId";
    }
    return "unknown";
}

ParseResult parse_message(const std::string& raw) {
    ParseResult result;

    json envelope;
    try {
        envelope = json::parse(raw);
    } catch (const json::parse_error& e) {
        result.status = ParseStatus::MALFORMED_JSON;
        result.detail = e.what();
        return result;
    }

    if (!envelope.is_object()) {
        result.status = ParseStatus::NOT_AN_OBJECT;
        return result;
    }

    auto event_it = envelope.find("event");
    if (event_it == envelope.end() || !event_it->is_string()) {
        result.status = ParseStatus::MISSING_EVENT;
        return result;
    }

    std::string tag = event_it->get<std::string>();
    std::optional<EventType> event = event_from_string(tag);
    if (!event || !is_client_event(*event)) {
        result.status = ParseStatus::UNKNOWN_EVENT;
        result.detail = tag;
        return result;
    }

    auto room_it = envelope.find("roomId");
    if (room_it == envelope.end() || !room_it->is_string() || room_it->get<std::string>().empty()) {
        result.status = ParseStatus::MISSING_ROOM_ID;
        result.detail = tag;
        return result;
    }

    SignalingMessage message;
    message.event = *event;
    message.room_id = room_it->get<std::string>();
    message.raw = raw;

    if (!is_relay_event(*event)) {
        auto payload_it = envelope.find("payload");
        if (payload_it != envelope.end()) {
            message.payload = *payload_it;
        }
    }

    result.status = ParseStatus::OK;
    result.message = std::move(message);
    return result;
}

std::string extract_user_name(const json& payload) {
    if (!payload.is_object()) {
        return "";
    }

    auto it = payload.find("userName");
    if (it == payload.end() || !it->is_string()) {
        return "";
    }

    return it->get<std::string>();
}

std::string make_joined_message(const std::string& room_id) {
    json message = {
        {"event", to_string(EventType::JOINED)},
        {"roomId", room_id}
    };
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string make_user_joined_message(const std::string& room_id, const std::string& user_name) {
    return make_presence_message(EventType::USER_JOINED, room_id, user_name);
}

std::string make_user_left_message(const std::string& room_id, const std::string& user_name) {
    return make_presence_message(EventType::USER_LEFT, room_id, user_name);
}

} // namespace monkeychat
