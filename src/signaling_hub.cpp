#include "signaling_hub.hpp"
#include "signaling_session.hpp"
#include "utils/logger.hpp"

namespace monkeychat {

const char* to_string(DeleteRoomResult result) {
    switch (result) {
        case DeleteRoomResult::DELETED: return "deleted";
        case DeleteRoomResult::INVALID_REQUEST: return "invalid request";
        case DeleteRoomResult::UNAUTHORIZED: return "unauthorized";
        case DeleteRoomResult::NOT_FOUND: return "room not found";
        case DeleteRoomResult::FORBIDDEN: return "only the room creator can delete the room";
        case DeleteRoomResult::STORE_ERROR: return "error deleting room";
    }
    return "unknown";
}

SignalingHub::SignalingHub(RoomStore* store)
    : store_(store)
    , relay_(registry_)
{
}

std::shared_ptr<SignalingSession> SignalingHub::open_session(std::shared_ptr<Transport> transport, Identity identity) {
    auto connection = std::make_shared<Connection>(std::move(transport), std::move(identity));
    auto session = std::make_shared<SignalingSession>(*this, connection);

    size_t open = ++open_sessions_;
    Logger::info("SignalingHub", "Connection #" + std::to_string(connection->id()) + " established from " +
                 connection->remote_endpoint() + " as " + describe(connection->identity()) +
                 ". Open connections: " + std::to_string(open));
    return session;
}

void SignalingHub::on_session_closed() {
    --open_sessions_;
}

size_t SignalingHub::restore_rooms() {
    if (!store_) {
        return 0;
    }

    size_t restored = 0;
    for (const auto& record : store_->list_room_records()) {
        if (registry_.ensure_room(record.id)) {
            restored++;
        }
    }

    Logger::info("SignalingHub", "Restored " + std::to_string(restored) + " room(s) from durable storage");
    return restored;
}

void SignalingHub::on_room_created(const std::string& room_id, const Connection& creator) {
    const AuthenticatedIdentity* user = as_authenticated(creator.identity());
    if (!user) {
        return;
    }

    if (!store_) {
        Logger::debug("SignalingHub", "No room store configured, room " + room_id + " stays in memory only");
        return;
    }

    if (!store_->create_room_record(room_id, user->user_id)) {
        Logger::error("SignalingHub", "Error adding room " + room_id + " to database");
        return;
    }

    Logger::info("SignalingHub", "New active room added: " + room_id + " created by " + user->username +
                 " (ID: " + std::to_string(user->user_id) + ")");
}

DeleteRoomResult SignalingHub::delete_room(const std::string& room_id, const Identity& requester) {
    if (room_id.empty()) {
        return DeleteRoomResult::INVALID_REQUEST;
    }

    const AuthenticatedIdentity* user = as_authenticated(requester);
    if (!user) {
        Logger::warn("SignalingHub", "Anonymous request to delete room " + room_id + " refused");
        return DeleteRoomResult::UNAUTHORIZED;
    }

    if (!store_) {
        return DeleteRoomResult::NOT_FOUND;
    }

    std::optional<RoomRecord> record = store_->find_room_record(room_id);
    if (!record) {
        return DeleteRoomResult::NOT_FOUND;
    }

    if (record->created_by != user->user_id) {
        Logger::warn("SignalingHub", "User " + describe(requester) + " may not delete room " + room_id +
                     " created by " + std::to_string(record->created_by));
        return DeleteRoomResult::FORBIDDEN;
    }

    if (!store_->delete_room_record(room_id)) {
        return DeleteRoomResult::STORE_ERROR;
    }

    std::vector<ConnectionPtr> evicted;
    registry_.remove_room(room_id, &evicted);

    Logger::info("SignalingHub", "Room " + room_id + " deleted by user " + describe(requester) +
                 (evicted.empty() ? "" : ", " + std::to_string(evicted.size()) + " member(s) unregistered"));
    return DeleteRoomResult::DELETED;
}

void SignalingHub::log_room_status() const {
    auto rooms = registry_.snapshot();

    Logger::info("SignalingHub", "Current room status:");
    for (const auto& [room_id, names] : rooms) {
        std::string users;
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) {
                users += ", ";
            }
            users += names[i];
        }
        Logger::info("SignalingHub", "  Room " + room_id + ": " + std::to_string(names.size()) +
                     " connections - Users: [" + users + "]");
    }
}

} // namespace monkeychat
