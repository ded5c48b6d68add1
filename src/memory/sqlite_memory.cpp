#include "sqlite_memory.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <system_error>

namespace memkeep {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static StoreErrorKind kind_for(int rc) {
    if ((rc & 0xff) == SQLITE_CONSTRAINT) return StoreErrorKind::ConstraintViolation;
    return StoreErrorKind::IoFailure;
}

[[noreturn]] static void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw StoreError(kind_for(rc), what + ": " + msg);
}

static void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    int rc = sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr);
    if (rc != SQLITE_OK) throw_sqlite(db, rc, "prepare failed");
}

// Step a statement that returns no rows.
static void step_done(sqlite3* db, StmtGuard& g) {
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db, rc, "statement failed");
}

// Bind a text value to a named parameter if the statement uses it.
static void bind_named_text(sqlite3_stmt* stmt, const char* name, const std::string& value) {
    int idx = sqlite3_bind_parameter_index(stmt, name);
    if (idx > 0) sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_STATIC);
}

static std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

// Read a full MemoryRecord from a statement that selected
// id, title, content, created_at, updated_at (columns 0-4).
static MemoryRecord record_from_stmt(sqlite3_stmt* stmt) {
    MemoryRecord record;
    record.id         = sqlite3_column_int64(stmt, 0);
    record.title      = column_string(stmt, 1);
    record.content    = column_string(stmt, 2);
    record.created_at = column_string(stmt, 3);
    record.updated_at = column_string(stmt, 4);
    return record;
}

// One statement per column combination; the column list is never built at runtime.
static const char* update_sql_for(const MemoryPatch& patch) {
    if (patch.title && patch.content) {
        return "UPDATE memories SET title = :title, content = :content,"
               " updated_at = :updated_at WHERE id = :id;";
    }
    if (patch.title) {
        return "UPDATE memories SET title = :title, updated_at = :updated_at WHERE id = :id;";
    }
    return "UPDATE memories SET content = :content, updated_at = :updated_at WHERE id = :id;";
}

SqliteMemory::SqliteMemory(const std::string& path) : path_(path) {}

SqliteMemory::~SqliteMemory() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void SqliteMemory::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    connection();
}

bool SqliteMemory::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void SqliteMemory::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void SqliteMemory::close_locked() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

sqlite3* SqliteMemory::connection() {
    if (db_) return db_;

    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError(StoreErrorKind::IoFailure,
                             "failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError(StoreErrorKind::IoFailure, "failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (const StoreError&) {
        close_locked();
        throw;
    }
    return db_;
}

void SqliteMemory::init_schema() {
    // AUTOINCREMENT keeps ids monotonic: a deleted id is never handed out again.
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  title      TEXT NOT NULL,"
        "  content    TEXT NOT NULL,"
        "  created_at TEXT NOT NULL,"
        "  updated_at TEXT NOT NULL"
        ");";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, create_table, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw StoreError(kind_for(rc), "failed to create schema: " + msg);
    }
}

int64_t SqliteMemory::add(const std::string& title, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = connection();

    std::string now = timestamp_now();

    StmtGuard g;
    prepare(db,
            "INSERT INTO memories (title, content, created_at, updated_at)"
            " VALUES (?, ?, ?, ?);",
            g);
    sqlite3_bind_text(g.stmt, 1, title.c_str(),   -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, content.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, now.c_str(),     -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, now.c_str(),     -1, SQLITE_STATIC);
    step_done(db, g);

    return sqlite3_last_insert_rowid(db);
}

std::optional<MemoryRecord> SqliteMemory::get_by_id(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = connection();

    StmtGuard g;
    prepare(db,
            "SELECT id, title, content, created_at, updated_at"
            " FROM memories WHERE id = ?;",
            g);
    sqlite3_bind_int64(g.stmt, 1, id);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return record_from_stmt(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db, rc, "lookup failed");
    return std::nullopt;
}

std::optional<MemoryRecord> SqliteMemory::get_by_title(const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = connection();

    StmtGuard g;
    prepare(db,
            "SELECT id, title, content, created_at, updated_at"
            " FROM memories WHERE title = ? ORDER BY id LIMIT 1;",
            g);
    sqlite3_bind_text(g.stmt, 1, title.c_str(), -1, SQLITE_STATIC);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return record_from_stmt(g.stmt);
    if (rc != SQLITE_DONE) throw_sqlite(db, rc, "lookup failed");
    return std::nullopt;
}

std::vector<MemorySummary> SqliteMemory::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = connection();

    StmtGuard g;
    prepare(db, "SELECT id, title FROM memories ORDER BY id;", g);

    std::vector<MemorySummary> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        results.push_back(MemorySummary{sqlite3_column_int64(g.stmt, 0),
                                        column_string(g.stmt, 1)});
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) throw_sqlite(db, rc, "list failed");
    return results;
}

bool SqliteMemory::update(int64_t id, const MemoryPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = connection();

    if (patch.empty()) {
        // Nothing to apply: report existence only, leave updated_at alone
        StmtGuard g;
        prepare(db, "SELECT 1 FROM memories WHERE id = ?;", g);
        sqlite3_bind_int64(g.stmt, 1, id);
        int rc = sqlite3_step(g.stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) throw_sqlite(db, rc, "lookup failed");
        return rc == SQLITE_ROW;
    }

    std::string now = timestamp_now();

    StmtGuard g;
    prepare(db, update_sql_for(patch), g);
    if (patch.title)   bind_named_text(g.stmt, ":title", *patch.title);
    if (patch.content) bind_named_text(g.stmt, ":content", *patch.content);
    bind_named_text(g.stmt, ":updated_at", now);
    sqlite3_bind_int64(g.stmt, sqlite3_bind_parameter_index(g.stmt, ":id"), id);
    step_done(db, g);

    return sqlite3_changes(db) > 0;
}

bool SqliteMemory::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = connection();

    StmtGuard g;
    prepare(db, "DELETE FROM memories WHERE id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, id);
    step_done(db, g);

    return sqlite3_changes(db) > 0;
}

} // namespace memkeep
