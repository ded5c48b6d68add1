#pragma once
#include "tool.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace memkeep {

struct MemoryRecord {
    int64_t id = 0;
    std::string title;
    std::string content;
    std::string created_at;
    std::string updated_at;
};

// Lightweight projection returned by Memory::list()
struct MemorySummary {
    int64_t id = 0;
    std::string title;
};

// Optional field assignments for a partial update.
struct MemoryPatch {
    std::optional<std::string> title;
    std::optional<std::string> content;

    bool empty() const { return !title && !content; }
};

// "Not found" is never an error kind: lookups return optional/bool instead.
enum class StoreErrorKind { IoFailure, ConstraintViolation };

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    StoreErrorKind kind() const { return kind_; }

private:
    StoreErrorKind kind_;
};

std::string store_error_kind_to_string(StoreErrorKind kind);

// Abstract memory store interface
class Memory {
public:
    virtual ~Memory() = default;

    virtual std::string backend_name() const = 0;

    // Insert a new record. Returns the store-assigned id.
    virtual int64_t add(const std::string& title, const std::string& content) = 0;

    virtual std::optional<MemoryRecord> get_by_id(int64_t id) = 0;

    // Exact title match. When titles collide the lowest id wins.
    virtual std::optional<MemoryRecord> get_by_title(const std::string& title) = 0;

    // All records as {id, title}, in insertion order.
    virtual std::vector<MemorySummary> list() = 0;

    // Apply the supplied fields and bump updated_at. An empty patch on an
    // existing record changes nothing and still returns true.
    // Returns false if no record has this id.
    virtual bool update(int64_t id, const MemoryPatch& patch) = 0;

    // Hard delete. Returns true if found and deleted.
    virtual bool remove(int64_t id) = 0;

    // Release the underlying connection. Later calls reopen it.
    virtual void close() {}
};

// Base class for tools that need a Memory* pointer.
// create_memory_tools() wires this up after construction.
class MemoryAwareTool : public Tool {
public:
    void set_memory(Memory* mem) { memory_ = mem; }

protected:
    Memory* memory_ = nullptr;
};

} // namespace memkeep
