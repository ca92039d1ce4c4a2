#include "room_registry.hpp"
#include <algorithm>
#include <mutex>

namespace monkeychat {

JoinSnapshot RoomRegistry::register_connection(const std::string& room_id, const ConnectionPtr& connection) {
    JoinSnapshot result;

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        it = rooms_.emplace(room_id, std::vector<ConnectionPtr>{}).first;
        result.room_created = true;
    }

    auto& members = it->second;
    for (const auto& member : members) {
        if (member == connection) {
            result.already_member = true;
        } else {
            result.existing_members.push_back(member);
        }
    }

    if (!result.already_member) {
        members.push_back(connection);
    }

    return result;
}

std::vector<std::string> RoomRegistry::unregister_connection(const ConnectionPtr& connection) {
    std::vector<std::string> left_rooms;

    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (auto& [room_id, members] : rooms_) {
        auto new_end = std::remove(members.begin(), members.end(), connection);
        if (new_end != members.end()) {
            members.erase(new_end, members.end());
            left_rooms.push_back(room_id);
        }
    }

    return left_rooms;
}

bool RoomRegistry::unregister_from_room(const std::string& room_id, const ConnectionPtr& connection) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return false;
    }

    auto& members = it->second;
    auto new_end = std::remove(members.begin(), members.end(), connection);
    if (new_end == members.end()) {
        return false;
    }

    members.erase(new_end, members.end());
    return true;
}

std::vector<ConnectionPtr> RoomRegistry::members_except(const std::string& room_id,
                                                        const ConnectionPtr& exclude) const {
    std::vector<ConnectionPtr> result;

    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return result;
    }

    result.reserve(it->second.size());
    for (const auto& member : it->second) {
        if (member != exclude) {
            result.push_back(member);
        }
    }

    return result;
}

std::vector<ConnectionPtr> RoomRegistry::members(const std::string& room_id) const {
    return members_except(room_id, nullptr);
}

bool RoomRegistry::is_member(const std::string& room_id, const ConnectionPtr& connection) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return false;
    }

    return std::find(it->second.begin(), it->second.end(), connection) != it->second.end();
}

bool RoomRegistry::contains_room(const std::string& room_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rooms_.find(room_id) != rooms_.end();
}

bool RoomRegistry::ensure_room(const std::string& room_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return rooms_.emplace(room_id, std::vector<ConnectionPtr>{}).second;
}

bool RoomRegistry::remove_room(const std::string& room_id, std::vector<ConnectionPtr>* evicted) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return false;
    }

    if (evicted) {
        *evicted = std::move(it->second);
    }
    rooms_.erase(it);
    return true;
}

size_t RoomRegistry::room_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rooms_.size();
}

size_t RoomRegistry::member_count(const std::string& room_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    return it == rooms_.end() ? 0 : it->second.size();
}

std::map<std::string, std::vector<std::string>> RoomRegistry::snapshot() const {
    std::map<std::string, std::vector<std::string>> result;

    std::shared_lock<std::shared_mutex> lock(mutex_);

    for (const auto& [room_id, members] : rooms_) {
        auto& names = result[room_id];
        for (const auto& member : members) {
            names.push_back(member->display_name());
        }
    }

    return result;
}

} // namespace monkeychat
