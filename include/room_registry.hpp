#pragma once
#include <string>
#include <vector>
#include <map>
#include <shared_mutex>
#include "connection.hpp"

namespace monkeychat {

// Result of registering a connection: who was already present when it joined
struct JoinSnapshot {
    bool room_created = false;
    bool already_member = false;
    std::vector<ConnectionPtr> existing_members;
};

/**
 * Room id -> ordered member list (join order), guarded by one reader/writer
 * lock for the whole map. The lock covers the in-memory update or copy
 * only; callers write to connections after it has been released.
 *
 * Rooms outlive their members: removing the last member leaves an empty
 * entry behind. Only remove_room() drops an entry.
 */
class RoomRegistry {
public:
    RoomRegistry() = default;

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // Adds the connection, creating the room if needed, and returns the
    // members that were present before it. Registering a connection that is
    // already a member does not add it twice.
    JoinSnapshot register_connection(const std::string& room_id, const ConnectionPtr& connection);

    // Removes the connection from every room; returns the rooms it was in
    std::vector<std::string> unregister_connection(const ConnectionPtr& connection);

    bool unregister_from_room(const std::string& room_id, const ConnectionPtr& connection);

    // Snapshot of the room's members without `exclude` (nullptr keeps everyone)
    std::vector<ConnectionPtr> members_except(const std::string& room_id, const ConnectionPtr& exclude) const;
    std::vector<ConnectionPtr> members(const std::string& room_id) const;

    bool is_member(const std::string& room_id, const ConnectionPtr& connection) const;
    bool contains_room(const std::string& room_id) const;

    // Creates an empty room entry; false if it already existed
    bool ensure_room(const std::string& room_id);

    // Drops the entry entirely; returns false if there was none
    bool remove_room(const std::string& room_id, std::vector<ConnectionPtr>* evicted = nullptr);

    size_t room_count() const;
    size_t member_count(const std::string& room_id) const;

    // room id -> member display names, in join order
    std::map<std::string, std::vector<std::string>> snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<ConnectionPtr>> rooms_;
};

} // namespace monkeychat
