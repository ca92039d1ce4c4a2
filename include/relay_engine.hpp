#pragma once
#include <string>
#include <vector>
#include "room_registry.hpp"

namespace monkeychat {

struct DeliveryReport {
    size_t attempted = 0;
    size_t delivered = 0;

    size_t failed() const { return attempted - delivered; }
};

/**
 * Fan-out of one message to the other members of a room.
 * Best effort, at most once per recipient: a failed write is logged and
 * the remaining recipients are still served. Nothing is retried or buffered.
 */
class RelayEngine {
public:
    explicit RelayEngine(RoomRegistry& registry);

    // Forwards the exact inbound bytes to every member except the sender
    DeliveryReport relay(const std::string& room_id, const ConnectionPtr& sender,
                         const std::string& raw_message, const std::string& event_name);

    // Sends a server-built message to every member except the sender
    DeliveryReport broadcast(const std::string& room_id, const ConnectionPtr& sender,
                             const std::string& message, const std::string& event_name);

    bool send_to(const ConnectionPtr& recipient, const std::string& message, const std::string& event_name);

private:
    DeliveryReport deliver(const std::vector<ConnectionPtr>& recipients, const ConnectionPtr& sender,
                           const std::string& room_id, const std::string& message,
                           const std::string& event_name);

    RoomRegistry& registry_;
};

} // namespace monkeychat
