#include "relay_engine.hpp"
#include "utils/logger.hpp"

namespace monkeychat {

RelayEngine::RelayEngine(RoomRegistry& registry)
    : registry_(registry)
{
}

DeliveryReport RelayEngine::relay(const std::string& room_id, const ConnectionPtr& sender,
                                  const std::string& raw_message, const std::string& event_name) {
    if (!registry_.contains_room(room_id)) {
        Logger::warn("RelayEngine", "Room " + room_id + " not found, dropping " + event_name);
        return {};
    }

    // Snapshot under the shared lock; writes happen after it is released
    std::vector<ConnectionPtr> recipients = registry_.members_except(room_id, sender);
    return deliver(recipients, sender, room_id, raw_message, event_name);
}

DeliveryReport RelayEngine::broadcast(const std::string& room_id, const ConnectionPtr& sender,
                                      const std::string& message, const std::string& event_name) {
    std::vector<ConnectionPtr> recipients = registry_.members_except(room_id, sender);
    return deliver(recipients, sender, room_id, message, event_name);
}

bool RelayEngine::send_to(const ConnectionPtr& recipient, const std::string& message,
                          const std::string& event_name) {
    if (!recipient) {
        return false;
    }

    if (!recipient->send(message)) {
        Logger::error("RelayEngine", "Error sending " + event_name + " message to connection #" +
                      std::to_string(recipient->id()) + " (" + recipient->remote_endpoint() + ")");
        return false;
    }
    return true;
}

DeliveryReport RelayEngine::deliver(const std::vector<ConnectionPtr>& recipients, const ConnectionPtr& sender,
                                    const std::string& room_id, const std::string& message,
                                    const std::string& event_name) {
    DeliveryReport report;
    const std::string sender_name = sender ? sender->display_name() : "server";

    for (const auto& recipient : recipients) {
        report.attempted++;
        if (send_to(recipient, message, event_name)) {
            report.delivered++;
            Logger::debug("RelayEngine", "Relayed " + event_name + " message from '" + sender_name +
                          "' to '" + recipient->display_name() + "' in room " + room_id);
        }
    }

    if (report.failed() > 0) {
        Logger::warn("RelayEngine", event_name + " in room " + room_id + ": " +
                     std::to_string(report.failed()) + " of " + std::to_string(report.attempted) +
                     " deliveries failed");
    }

    return report;
}

} // namespace monkeychat
