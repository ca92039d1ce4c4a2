#include "connection.hpp"

namespace monkeychat {

std::atomic<uint64_t> Connection::next_id_{1};

Connection::Connection(std::shared_ptr<Transport> transport, Identity identity)
    : id_(next_id_.fetch_add(1))
    , transport_(std::move(transport))
    , identity_(std::move(identity))
{
    if (const auto* user = as_authenticated(identity_)) {
        display_name_ = user->username;
    }
}

std::string Connection::remote_endpoint() const {
    return transport_ ? transport_->remote_endpoint() : "unknown";
}

std::string Connection::display_name() const {
    std::lock_guard<std::mutex> lock(name_mutex_);
    return display_name_;
}

bool Connection::has_display_name() const {
    std::lock_guard<std::mutex> lock(name_mutex_);
    return !display_name_.empty();
}

bool Connection::resolve_display_name(const std::string& name) {
    std::lock_guard<std::mutex> lock(name_mutex_);
    if (!display_name_.empty() || name.empty()) {
        return false;
    }
    display_name_ = name;
    return true;
}

bool Connection::send(const std::string& message) {
    if (!transport_) {
        send_failures_++;
        return false;
    }

    bool ok;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        ok = transport_->send_text(message);
    }

    if (ok) {
        messages_sent_++;
    } else {
        send_failures_++;
    }
    return ok;
}

} // namespace monkeychat
