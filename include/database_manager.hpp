#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include "room_store.hpp"

namespace monkeychat {

/**
 * Database Manager for durable room records
 * Uses SQLite for local database operations
 */
class DatabaseManager : public RoomStore {
public:
    DatabaseManager();
    ~DatabaseManager() override;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Database initialization (":memory:" opens a private in-memory database)
    bool initialize(const std::string& db_path = "monkeychat.db");
    void close();
    bool is_connected() const;

    // ===== ROOM OPERATIONS =====

    bool create_room_record(const std::string& room_id, int64_t creator_id) override;
    bool delete_room_record(const std::string& room_id) override;
    std::optional<RoomRecord> find_room_record(const std::string& room_id) override;
    std::vector<RoomRecord> list_room_records() override;
    std::vector<RoomRecord> list_room_records_by_creator(int64_t creator_id) override;

private:
    sqlite3* db_;
    bool is_connected_;
    std::string db_path_;
    mutable std::mutex db_mutex_;

    struct PreparedStatements {
        sqlite3_stmt* insert_room = nullptr;
        sqlite3_stmt* delete_room = nullptr;
        sqlite3_stmt* get_room = nullptr;
        sqlite3_stmt* get_all_rooms = nullptr;
        sqlite3_stmt* get_rooms_by_creator = nullptr;
    } prepared_statements_;

    bool create_tables();
    bool prepare_statements();
    void finalize_statements();
    void close_locked();

    RoomRecord room_from_statement(sqlite3_stmt* stmt);
    std::vector<RoomRecord> collect_rooms(sqlite3_stmt* stmt);
    void log_sqlite_error(const std::string& operation);

    // Database schema
    static const char* CREATE_ROOMS_TABLE;
    static const char* CREATE_ROOMS_INDICES;
};

} // namespace monkeychat
