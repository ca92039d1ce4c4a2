#include "database_manager.hpp"
#include "utils/logger.hpp"

namespace monkeychat {

// Database schema SQL constants
const char* DatabaseManager::CREATE_ROOMS_TABLE = R"(
    CREATE TABLE IF NOT EXISTS rooms (
        id TEXT PRIMARY KEY,
        created_by INTEGER NOT NULL,
        created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
    )
)";

const char* DatabaseManager::CREATE_ROOMS_INDICES =
    "CREATE INDEX IF NOT EXISTS idx_rooms_created_by ON rooms(created_by);";

DatabaseManager::DatabaseManager()
    : db_(nullptr)
    , is_connected_(false)
{
}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (is_connected_) {
        close_locked();
    }

    db_path_ = db_path;
    Logger::info("DatabaseManager", "Opening database " + db_path_);

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        Logger::error("DatabaseManager", "Failed to open database: " +
                      std::string(db_ ? sqlite3_errmsg(db_) : "out of memory"));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    is_connected_ = true;

    char* error_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        Logger::warn("DatabaseManager", "Failed to enable foreign keys: " +
                     std::string(error_msg ? error_msg : "unknown error"));
        sqlite3_free(error_msg);
    }

    if (!create_tables()) {
        Logger::error("DatabaseManager", "Failed to create tables");
        close_locked();
        return false;
    }

    if (!prepare_statements()) {
        Logger::error("DatabaseManager", "Failed to prepare statements");
        close_locked();
        return false;
    }

    Logger::info("DatabaseManager", "Database initialized successfully");
    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    close_locked();
}

void DatabaseManager::close_locked() {
    if (!is_connected_) {
        return;
    }

    finalize_statements();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    is_connected_ = false;
    Logger::info("DatabaseManager", "Database connection closed");
}

bool DatabaseManager::is_connected() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return is_connected_;
}

bool DatabaseManager::create_tables() {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, CREATE_ROOMS_TABLE, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        Logger::error("DatabaseManager", "Failed to create rooms table: " +
                      std::string(error_msg ? error_msg : "unknown error"));
        sqlite3_free(error_msg);
        return false;
    }

    error_msg = nullptr;
    rc = sqlite3_exec(db_, CREATE_ROOMS_INDICES, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        Logger::warn("DatabaseManager", "Failed to create index: " +
                     std::string(error_msg ? error_msg : "unknown error"));
        sqlite3_free(error_msg);
    }

    return true;
}

bool DatabaseManager::prepare_statements() {
    struct {
        sqlite3_stmt** stmt;
        const char* sql;
    } statements[] = {
        {&prepared_statements_.insert_room,
         "INSERT INTO rooms (id, created_by) VALUES (?, ?)"},
        {&prepared_statements_.delete_room,
         "DELETE FROM rooms WHERE id = ?"},
        {&prepared_statements_.get_room,
         "SELECT id, created_by, created_at FROM rooms WHERE id = ?"},
        {&prepared_statements_.get_all_rooms,
         "SELECT id, created_by, created_at FROM rooms ORDER BY created_at, id"},
        {&prepared_statements_.get_rooms_by_creator,
         "SELECT id, created_by, created_at FROM rooms WHERE created_by = ? ORDER BY created_at, id"}
    };

    for (const auto& stmt_info : statements) {
        int rc = sqlite3_prepare_v2(db_, stmt_info.sql, -1, stmt_info.stmt, nullptr);
        if (rc != SQLITE_OK) {
            log_sqlite_error("prepare statement");
            finalize_statements();
            return false;
        }
    }

    return true;
}

void DatabaseManager::finalize_statements() {
    sqlite3_stmt** statements[] = {
        &prepared_statements_.insert_room,
        &prepared_statements_.delete_room,
        &prepared_statements_.get_room,
        &prepared_statements_.get_all_rooms,
        &prepared_statements_.get_rooms_by_creator
    };

    for (sqlite3_stmt** stmt : statements) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
}

// ===== ROOM OPERATIONS =====

bool DatabaseManager::create_room_record(const std::string& room_id, int64_t creator_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!prepared_statements_.insert_room) return false;

    sqlite3_stmt* stmt = prepared_statements_.insert_room;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);

    sqlite3_bind_text(stmt, 1, room_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, creator_id);

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        log_sqlite_error("insert room " + room_id);
        return false;
    }

    Logger::info("DatabaseManager", "Room created in database: " + room_id +
                 " (Created by: " + std::to_string(creator_id) + ")");
    return true;
}

bool DatabaseManager::delete_room_record(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!prepared_statements_.delete_room) return false;

    sqlite3_stmt* stmt = prepared_statements_.delete_room;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);

    sqlite3_bind_text(stmt, 1, room_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        log_sqlite_error("delete room " + room_id);
        return false;
    }

    Logger::info("DatabaseManager", "Room deleted from database: " + room_id);
    return true;
}

std::optional<RoomRecord> DatabaseManager::find_room_record(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!prepared_statements_.get_room) return std::nullopt;

    sqlite3_stmt* stmt = prepared_statements_.get_room;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);

    sqlite3_bind_text(stmt, 1, room_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<RoomRecord> record;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        record = room_from_statement(stmt);
    } else if (rc != SQLITE_DONE) {
        log_sqlite_error("get room " + room_id);
    }

    sqlite3_reset(stmt);
    return record;
}

std::vector<RoomRecord> DatabaseManager::list_room_records() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!prepared_statements_.get_all_rooms) return {};

    return collect_rooms(prepared_statements_.get_all_rooms);
}

std::vector<RoomRecord> DatabaseManager::list_room_records_by_creator(int64_t creator_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!prepared_statements_.get_rooms_by_creator) return {};

    sqlite3_stmt* stmt = prepared_statements_.get_rooms_by_creator;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_int64(stmt, 1, creator_id);

    return collect_rooms(stmt);
}

// ===== HELPERS =====

std::vector<RoomRecord> DatabaseManager::collect_rooms(sqlite3_stmt* stmt) {
    std::vector<RoomRecord> rooms;

    sqlite3_reset(stmt);
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rooms.push_back(room_from_statement(stmt));
    }

    if (rc != SQLITE_DONE) {
        log_sqlite_error("list rooms");
    }

    sqlite3_reset(stmt);
    return rooms;
}

RoomRecord DatabaseManager::room_from_statement(sqlite3_stmt* stmt) {
    RoomRecord room;

    room.id = sqlite3_column_text(stmt, 0) ? (const char*)sqlite3_column_text(stmt, 0) : "";
    room.created_by = sqlite3_column_int64(stmt, 1);
    room.created_at = sqlite3_column_text(stmt, 2) ? (const char*)sqlite3_column_text(stmt, 2) : "";

    return room;
}

void DatabaseManager::log_sqlite_error(const std::string& operation) {
    std::string error_msg = db_ ? std::string(sqlite3_errmsg(db_)) : "No database connection";
    Logger::error("DatabaseManager", operation + " failed: " + error_msg);
}

} // namespace monkeychat
