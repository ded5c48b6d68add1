#pragma once
#include "../memory.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace memkeep {

// SQLite-backed store. Owns a single connection that is opened on first use
// and transparently reopened after close().
class SqliteMemory : public Memory {
public:
    explicit SqliteMemory(const std::string& path);
    ~SqliteMemory() override;

    // Non-copyable
    SqliteMemory(const SqliteMemory&) = delete;
    SqliteMemory& operator=(const SqliteMemory&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    int64_t add(const std::string& title, const std::string& content) override;

    std::optional<MemoryRecord> get_by_id(int64_t id) override;

    std::optional<MemoryRecord> get_by_title(const std::string& title) override;

    std::vector<MemorySummary> list() override;

    bool update(int64_t id, const MemoryPatch& patch) override;

    bool remove(int64_t id) override;

    void close() override;

    // Open the connection and create the schema now. Throws StoreError.
    void open();

    bool is_open() const;

    const std::string& path() const { return path_; }

private:
    // Returns the live connection, opening it if absent. Caller holds mutex_.
    sqlite3* connection();
    void init_schema();
    void close_locked();

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace memkeep
