#include "delete_memory.hpp"
#include "tool_util.hpp"
#include <nlohmann/json.hpp>

namespace memkeep {

ToolResult DeleteMemoryTool::execute(const nlohmann::json& args) {
    if (auto err = require_memory(memory_)) return *err;
    if (auto err = require_object_or_absent(args)) return *err;
    if (!has_arg(args, "memory_id")) {
        return ToolResult{false, "Missing memory_id argument"};
    }

    int64_t memory_id = 0;
    if (auto err = read_memory_id(args, memory_id)) return *err;

    std::string id_str = std::to_string(memory_id);
    try {
        if (memory_->remove(memory_id)) {
            return ToolResult{true, "Memory " + id_str + " deleted successfully."};
        }
        return ToolResult{true, "Memory with ID " + id_str + " not found."};
    } catch (const StoreError& e) {
        return store_failure("deleting memory", e);
    }
}

std::string DeleteMemoryTool::description() const {
    return "Delete a memory.";
}

std::string DeleteMemoryTool::parameters_json() const {
    return R"json({"type":"object","properties":{"memory_id":{"type":"integer","description":"The ID of the memory to delete"}},"required":["memory_id"],"title":"deleteMemoryArguments"})json";
}

} // namespace memkeep
