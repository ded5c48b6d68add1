#include "update_memory.hpp"
#include "tool_util.hpp"
#include <nlohmann/json.hpp>

namespace memkeep {

ToolResult UpdateMemoryTool::execute(const nlohmann::json& args) {
    if (auto err = require_memory(memory_)) return *err;
    if (auto err = require_object_or_absent(args)) return *err;
    if (!has_arg(args, "memory_id")) {
        return ToolResult{false, "Missing memory_id argument"};
    }

    int64_t memory_id = 0;
    if (auto err = read_memory_id(args, memory_id)) return *err;

    MemoryPatch patch;
    if (auto err = read_string(args, "title", patch.title)) return *err;
    if (auto err = read_string(args, "content", patch.content)) return *err;

    std::string id_str = std::to_string(memory_id);
    try {
        // An empty patch never mutates; it only tells us whether the id exists.
        bool found = memory_->update(memory_id, patch);
        if (!found) {
            return ToolResult{true, "Memory with ID " + id_str + " not found."};
        }
        if (patch.empty()) {
            return ToolResult{true,
                "Error: Please provide at least one field to update (title or content)."};
        }
        return ToolResult{true, "Memory " + id_str + " updated successfully."};
    } catch (const StoreError& e) {
        return store_failure("updating memory", e);
    }
}

std::string UpdateMemoryTool::description() const {
    return "Update an existing memory.";
}

std::string UpdateMemoryTool::parameters_json() const {
    return R"json({"type":"object","properties":{"memory_id":{"type":"integer","description":"The ID of the memory to update"},"title":{"type":"string","description":"Optional new title for the memory"},"content":{"type":"string","description":"Optional new content for the memory"}},"required":["memory_id"],"title":"updateMemoryArguments"})json";
}

} // namespace memkeep
