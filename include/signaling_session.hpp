#pragma once
#include <string>
#include <mutex>
#include "connection.hpp"
#include "signaling_message.hpp"

namespace monkeychat {

class SignalingHub;

enum class SessionState {
    CONNECTED,   // upgraded, no join processed yet
    JOINED,
    LEFT,        // client sent leave; may join again
    CLOSED       // transport gone, terminal
};

const char* to_string(SessionState state);

/**
 * Join/leave/relay state machine for one connection. Driven by the single
 * handler that reads the connection's transport; other connections only
 * ever write to it through the relay engine.
 */
class SignalingSession {
public:
    SignalingSession(SignalingHub& hub, ConnectionPtr connection);
    ~SignalingSession();

    SignalingSession(const SignalingSession&) = delete;
    SignalingSession& operator=(const SignalingSession&) = delete;

    // One inbound frame. Faults are logged and contained; never throws.
    void handle_message(const std::string& raw);

    // Transport closed or failed: unregister everywhere, tell nobody
    void handle_transport_closed();

    SessionState state() const;
    std::string room_id() const;
    const ConnectionPtr& connection() const { return connection_; }

private:
    void handle_join(const SignalingMessage& message);
    void handle_leave(const SignalingMessage& message);
    void handle_relay(const SignalingMessage& message);

    SignalingHub& hub_;
    const ConnectionPtr connection_;

    mutable std::mutex state_mutex_;
    SessionState state_ = SessionState::CONNECTED;
    std::string room_id_;
};

} // namespace monkeychat
