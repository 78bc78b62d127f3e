#include "data/db_manager.h"
#include "utils/globals.h"
#include "utils/errors.h"
#include "sqlite3.h"
#include <cstdio>
#include <mutex>

sqlite3* slot_db = nullptr;

namespace {

void log_db_error(const char* what) {
    std::lock_guard<std::mutex> lock(console_mtx);
    std::fprintf(stderr, "[DB] %s: %s\n", what, slot_db ? sqlite3_errmsg(slot_db) : "no database");
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

SlotData read_row(sqlite3_stmt* stmt) {
    SlotData data;
    data.seed_name = column_string(stmt, 0);
    data.player = sqlite3_column_int(stmt, 1);
    data.which_image = sqlite3_column_int(stmt, 2);
    data.orientation = sqlite3_column_double(stmt, 3);
    data.nx = sqlite3_column_int(stmt, 4);
    data.ny = sqlite3_column_int(stmt, 5);
    data.piece_order = parse_int_list(column_string(stmt, 6));
    data.possible_merges = parse_int_list(column_string(stmt, 7));
    data.actual_possible_merges = parse_int_list(column_string(stmt, 8));
    data.ap_world_version = column_string(stmt, 9);
    return data;
}

constexpr const char* SELECT_COLUMNS =
    "SELECT seed_name, player, which_image, orientation, nx, ny, "
    "piece_order, possible_merges, actual_possible_merges, ap_world_version FROM slot_data ";

} // namespace

bool init_db(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mtx);
    if (slot_db != nullptr) return true;

    if (sqlite3_open(db_path.c_str(), &slot_db) != SQLITE_OK) {
        log_db_error("open failed");
        sqlite3_close(slot_db);
        slot_db = nullptr;
        return false;
    }

    sqlite3_exec(slot_db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(slot_db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    const char* create_sql =
        "CREATE TABLE IF NOT EXISTS slot_data ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  seed_name TEXT NOT NULL, "
        "  player INTEGER NOT NULL, "
        "  which_image INTEGER, "
        "  orientation REAL, "
        "  nx INTEGER, "
        "  ny INTEGER, "
        "  piece_order TEXT, "
        "  possible_merges TEXT, "
        "  actual_possible_merges TEXT, "
        "  ap_world_version TEXT, "
        "  updated_at DATETIME DEFAULT CURRENT_TIMESTAMP, "
        "  UNIQUE(seed_name, player)"
        ");";
    char* err_msg = nullptr;
    if (sqlite3_exec(slot_db, create_sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        {
            std::lock_guard<std::mutex> console_lock(console_mtx);
            std::fprintf(stderr, "[DB] Error creating slot_data table: %s\n", err_msg ? err_msg : "unknown");
        }
        sqlite3_free(err_msg);
        sqlite3_close(slot_db);
        slot_db = nullptr;
        return false;
    }
    return true;
}

void close_db() {
    std::lock_guard<std::mutex> lock(db_mtx);
    if (!slot_db) return;

    // Final checkpoint to flush everything from WAL to main DB
    sqlite3_exec(slot_db, "PRAGMA wal_checkpoint(TRUNCATE);", nullptr, nullptr, nullptr);
    sqlite3_close(slot_db);
    slot_db = nullptr;
}

bool db_is_open() {
    std::lock_guard<std::mutex> lock(db_mtx);
    return slot_db != nullptr;
}

bool save_slot_data(const SlotData& data) {
    std::lock_guard<std::mutex> lock(db_mtx);
    if (!slot_db) return false;

    const char* sql =
        "INSERT INTO slot_data (seed_name, player, which_image, orientation, nx, ny, "
        "  piece_order, possible_merges, actual_possible_merges, ap_world_version) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(seed_name, player) DO UPDATE SET "
        "  which_image = excluded.which_image, "
        "  orientation = excluded.orientation, "
        "  nx = excluded.nx, "
        "  ny = excluded.ny, "
        "  piece_order = excluded.piece_order, "
        "  possible_merges = excluded.possible_merges, "
        "  actual_possible_merges = excluded.actual_possible_merges, "
        "  ap_world_version = excluded.ap_world_version, "
        "  updated_at = CURRENT_TIMESTAMP;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(slot_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        log_db_error("prepare insert failed");
        return false;
    }

    const std::string piece_order = serialize_int_list(data.piece_order);
    const std::string possible = serialize_int_list(data.possible_merges);
    const std::string actual = serialize_int_list(data.actual_possible_merges);

    sqlite3_bind_text(stmt, 1, data.seed_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, data.player);
    sqlite3_bind_int(stmt, 3, data.which_image);
    sqlite3_bind_double(stmt, 4, data.orientation);
    sqlite3_bind_int(stmt, 5, data.nx);
    sqlite3_bind_int(stmt, 6, data.ny);
    sqlite3_bind_text(stmt, 7, piece_order.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, possible.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, actual.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 10, data.ap_world_version.c_str(), -1, SQLITE_TRANSIENT);

    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok) log_db_error("insert slot data failed");
    sqlite3_finalize(stmt);
    return ok;
}

std::optional<SlotData> load_slot_data(const std::string& seed_name, int player) {
    std::lock_guard<std::mutex> lock(db_mtx);
    if (!slot_db) return std::nullopt;

    const std::string sql = std::string(SELECT_COLUMNS) + "WHERE seed_name = ? AND player = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(slot_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        log_db_error("prepare select failed");
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, seed_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, player);

    std::optional<SlotData> result;
    try {
        if (sqlite3_step(stmt) == SQLITE_ROW) result = read_row(stmt);
    } catch (const JigsawError&) {
        sqlite3_finalize(stmt);
        throw;
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<SlotData> load_all_slot_data(const std::string& seed_name) {
    std::lock_guard<std::mutex> lock(db_mtx);
    std::vector<SlotData> results;
    if (!slot_db) return results;

    const std::string sql = std::string(SELECT_COLUMNS) + "WHERE seed_name = ? ORDER BY player;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(slot_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        log_db_error("prepare select failed");
        return results;
    }
    sqlite3_bind_text(stmt, 1, seed_name.c_str(), -1, SQLITE_TRANSIENT);

    try {
        while (sqlite3_step(stmt) == SQLITE_ROW) results.push_back(read_row(stmt));
    } catch (const JigsawError&) {
        sqlite3_finalize(stmt);
        throw;
    }
    sqlite3_finalize(stmt);
    return results;
}
