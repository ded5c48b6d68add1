#include "get_memory.hpp"
#include "tool_util.hpp"
#include <nlohmann/json.hpp>

namespace memkeep {

ToolResult GetMemoryTool::execute(const nlohmann::json& args) {
    if (auto err = require_memory(memory_)) return *err;
    if (args.is_null()) return ToolResult{false, "Missing arguments"};
    if (auto err = require_object_or_absent(args)) return *err;

    std::optional<int64_t> memory_id;
    if (has_arg(args, "memory_id")) {
        int64_t id = 0;
        if (auto err = read_memory_id(args, id)) return *err;
        memory_id = id;
    }
    std::optional<std::string> title;
    if (auto err = read_string(args, "title", title)) return *err;

    if (!memory_id && !title) {
        return ToolResult{true, "Error: Please provide either a memory_id or title."};
    }

    try {
        // memory_id takes precedence when both are given
        auto record = memory_id ? memory_->get_by_id(*memory_id)
                                : memory_->get_by_title(*title);
        if (!record) {
            return ToolResult{true, "Memory not found."};
        }
        return ToolResult{true, "Title: " + record->title + "\n\nContent: " + record->content};
    } catch (const StoreError& e) {
        return store_failure("retrieving memory", e);
    }
}

std::string GetMemoryTool::description() const {
    return "Retrieve a specific memory by ID or title.";
}

std::string GetMemoryTool::parameters_json() const {
    return R"json({"type":"object","properties":{"memory_id":{"type":"integer","description":"The ID of the memory to retrieve"},"title":{"type":"string","description":"The title of the memory to retrieve"}},"title":"getMemoryArguments"})json";
}

} // namespace memkeep
