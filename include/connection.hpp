#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdint>
#include "identity.hpp"

namespace monkeychat {

/**
 * Outbound half of one duplex channel to a browser tab.
 * Implementations report a failed write by returning false; they must not throw.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool send_text(const std::string& message) = 0;
    virtual std::string remote_endpoint() const = 0;
};

class Connection {
public:
    Connection(std::shared_ptr<Transport> transport, Identity identity);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    uint64_t id() const { return id_; }
    const Identity& identity() const { return identity_; }
    std::string remote_endpoint() const;

    // Empty until resolved (authenticated username, or first join payload)
    std::string display_name() const;
    bool has_display_name() const;

    // Sets the display name once; later calls leave it unchanged and return false
    bool resolve_display_name(const std::string& name);

    // Serialised per connection so concurrent senders never interleave frames
    bool send(const std::string& message);

    uint64_t messages_sent() const { return messages_sent_.load(); }
    uint64_t send_failures() const { return send_failures_.load(); }

private:
    static std::atomic<uint64_t> next_id_;

    const uint64_t id_;
    const std::shared_ptr<Transport> transport_;
    const Identity identity_;

    mutable std::mutex name_mutex_;
    std::string display_name_;

    std::mutex send_mutex_;
    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> send_failures_{0};
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace monkeychat
