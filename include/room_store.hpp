#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace monkeychat {

struct RoomRecord {
    std::string id;
    int64_t created_by = 0;
    std::string created_at;   // "YYYY-MM-DD HH:MM:SS" UTC
};

/**
 * Durable room bookkeeping. The signaling core only ever creates a record
 * for the first authenticated joiner of a brand-new room and deletes one
 * through the authorized deletion path.
 */
class RoomStore {
public:
    virtual ~RoomStore() = default;

    virtual bool create_room_record(const std::string& room_id, int64_t creator_id) = 0;
    virtual bool delete_room_record(const std::string& room_id) = 0;
    virtual std::optional<RoomRecord> find_room_record(const std::string& room_id) = 0;
    virtual std::vector<RoomRecord> list_room_records() = 0;
    virtual std::vector<RoomRecord> list_room_records_by_creator(int64_t creator_id) = 0;
};

} // namespace monkeychat
