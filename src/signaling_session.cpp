#include "signaling_session.hpp"
#include "signaling_hub.hpp"
#include "utils/logger.hpp"

namespace monkeychat {

namespace {

const char* kAnonymousName = "Anonymous";

std::string session_tag(const Connection& connection) {
    return "connection #" + std::to_string(connection.id()) + " (" + connection.remote_endpoint() + ")";
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::CONNECTED: return "connected";
        case SessionState::JOINED: return "joined";
        case SessionState::LEFT: return "left";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

SignalingSession::SignalingSession(SignalingHub& hub, ConnectionPtr connection)
    : hub_(hub)
    , connection_(std::move(connection))
{
}

SignalingSession::~SignalingSession() {
    handle_transport_closed();
}

SessionState SignalingSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string SignalingSession::room_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return room_id_;
}

void SignalingSession::handle_message(const std::string& raw) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (state_ == SessionState::CLOSED) {
        Logger::debug("SignalingSession", "Ignoring message on closed " + session_tag(*connection_));
        return;
    }

    ParseResult parsed = parse_message(raw);
    switch (parsed.status) {
        case ParseStatus::OK:
            break;
        case ParseStatus::MALFORMED_JSON:
        case ParseStatus::NOT_AN_OBJECT:
            Logger::error("SignalingSession", "Error decoding message from " + session_tag(*connection_) +
                          ": " + to_string(parsed.status) +
                          (parsed.detail.empty() ? "" : " (" + parsed.detail + ")"));
            return;
        case ParseStatus::MISSING_EVENT:
        case ParseStatus::UNKNOWN_EVENT:
        case ParseStatus::MISSING_ROOM_ID:
            Logger::warn("SignalingSession", "Ignoring message from " + session_tag(*connection_) +
                         ": " + to_string(parsed.status) +
                         (parsed.detail.empty() ? "" : " '" + parsed.detail + "'"));
            return;
    }

    const SignalingMessage& message = *parsed.message;
    Logger::info("SignalingSession", "Received " + std::string(to_string(message.event)) + " message from " +
                 session_tag(*connection_) + " for room " + message.room_id);

    switch (message.event) {
        case EventType::JOIN:
            handle_join(message);
            break;
        case EventType::LEAVE:
            handle_leave(message);
            break;
        case EventType::OFFER:
        case EventType::ANSWER:
        case EventType::ICE_CANDIDATE:
            handle_relay(message);
            break;
        case EventType::JOINED:
        case EventType::USER_JOINED:
        case EventType::USER_LEFT:
            // parse_message only accepts client events
            break;
    }
}

void SignalingSession::handle_join(const SignalingMessage& message) {
    const std::string& room_id = message.room_id;

    // A room deleted out from under the session no longer holds it
    if (state_ == SessionState::JOINED && room_id_ != room_id &&
        hub_.registry().is_member(room_id_, connection_)) {
        Logger::warn("SignalingSession", session_tag(*connection_) + " is already in room " + room_id_ +
                     ", rejecting join for room " + room_id);
        return;
    }

    if (!connection_->has_display_name()) {
        std::string name = extract_user_name(message.payload);
        connection_->resolve_display_name(name.empty() ? kAnonymousName : name);
    }
    const std::string user_name = connection_->display_name();

    JoinSnapshot snapshot = hub_.registry().register_connection(room_id, connection_);
    if (snapshot.room_created) {
        Logger::info("SignalingSession", "New room created: " + room_id);
        hub_.on_room_created(room_id, *connection_);
    }

    state_ = SessionState::JOINED;
    room_id_ = room_id;

    RelayEngine& relay = hub_.relay();
    relay.send_to(connection_, make_joined_message(room_id), "joined");

    // Mutual presence: each existing member learns about the newcomer and vice versa
    const std::string announce = make_user_joined_message(room_id, user_name);
    for (const auto& existing : snapshot.existing_members) {
        relay.send_to(existing, announce, "user-joined");
        relay.send_to(connection_, make_user_joined_message(room_id, existing->display_name()), "user-joined");
    }

    Logger::info("SignalingSession", "User '" + user_name + "' " +
                 (snapshot.already_member ? "refreshed presence in" : "joined") + " room " + room_id +
                 ", connections: " + std::to_string(snapshot.existing_members.size() + 1));

    hub_.log_room_status();
}

void SignalingSession::handle_leave(const SignalingMessage& message) {
    const std::string& room_id = message.room_id;

    std::string leaving_name = extract_user_name(message.payload);
    if (leaving_name.empty()) {
        leaving_name = connection_->display_name();
    }
    if (leaving_name.empty()) {
        leaving_name = kAnonymousName;
    }

    RoomRegistry& registry = hub_.registry();
    if (registry.is_member(room_id, connection_)) {
        Logger::info("SignalingSession", "User '" + leaving_name + "' is leaving room " + room_id);
        hub_.relay().broadcast(room_id, connection_, make_user_left_message(room_id, leaving_name), "user-left");
    } else {
        Logger::debug("SignalingSession", session_tag(*connection_) + " sent leave for room " + room_id +
                      " without being a member");
    }

    for (const auto& left_room : registry.unregister_connection(connection_)) {
        Logger::info("SignalingSession", "Removed connection for user '" + leaving_name + "' from room " + left_room);
        if (registry.member_count(left_room) == 0) {
            Logger::info("SignalingSession", "Room " + left_room + " is now empty, but will be kept alive");
        }
    }

    state_ = SessionState::LEFT;
    room_id_.clear();
}

void SignalingSession::handle_relay(const SignalingMessage& message) {
    const std::string event_name = to_string(message.event);

    if (!hub_.registry().is_member(message.room_id, connection_)) {
        Logger::warn("SignalingSession", "Dropping " + event_name + " from " + session_tag(*connection_) +
                     ": not a member of room " + message.room_id);
        return;
    }

    hub_.relay().relay(message.room_id, connection_, message.raw, event_name);
}

void SignalingSession::handle_transport_closed() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (state_ == SessionState::CLOSED) {
        return;
    }

    RoomRegistry& registry = hub_.registry();
    for (const auto& left_room : registry.unregister_connection(connection_)) {
        Logger::info("SignalingSession", "Removed connection for user '" + connection_->display_name() +
                     "' from room " + left_room);
        if (registry.member_count(left_room) == 0) {
            Logger::info("SignalingSession", "Room " + left_room + " is now empty, but will be kept alive");
        }
    }

    state_ = SessionState::CLOSED;
    room_id_.clear();
    hub_.on_session_closed();

    Logger::info("SignalingSession", "Closed " + session_tag(*connection_));
}

} // namespace monkeychat
