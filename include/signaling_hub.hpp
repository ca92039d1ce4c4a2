#pragma once
#include <string>
#include <memory>
#include <atomic>
#include "identity.hpp"
#include "room_registry.hpp"
#include "relay_engine.hpp"
#include "room_store.hpp"

namespace monkeychat {

class SignalingSession;

enum class DeleteRoomResult {
    DELETED,
    INVALID_REQUEST,
    UNAUTHORIZED,
    NOT_FOUND,
    FORBIDDEN,
    STORE_ERROR
};

const char* to_string(DeleteRoomResult result);

/**
 * Process-wide signaling state, constructed once at startup and shared by
 * every connection handler: the room registry, the relay engine built on
 * it, and the durable room store (optional, may be null).
 */
class SignalingHub {
public:
    explicit SignalingHub(RoomStore* store = nullptr);

    SignalingHub(const SignalingHub&) = delete;
    SignalingHub& operator=(const SignalingHub&) = delete;

    std::shared_ptr<SignalingSession> open_session(std::shared_ptr<Transport> transport, Identity identity);

    // Re-registers every durable room as an empty room; returns how many were added
    size_t restore_rooms();

    // Authorized deletion: only the creator recorded in the store may delete
    DeleteRoomResult delete_room(const std::string& room_id, const Identity& requester);

    RoomRegistry& registry() { return registry_; }
    const RoomRegistry& registry() const { return registry_; }
    RelayEngine& relay() { return relay_; }
    RoomStore* store() const { return store_; }

    size_t open_sessions() const { return open_sessions_.load(); }

    void log_room_status() const;

private:
    friend class SignalingSession;

    // Called once for the first member of a brand-new room
    void on_room_created(const std::string& room_id, const Connection& creator);
    void on_session_closed();

    RoomStore* store_;
    RoomRegistry registry_;
    RelayEngine relay_;
    std::atomic<size_t> open_sessions_{0};
};

} // namespace monkeychat
