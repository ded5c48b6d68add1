#include "remember.hpp"
#include "tool_util.hpp"
#include <nlohmann/json.hpp>

namespace memkeep {

ToolResult RememberTool::execute(const nlohmann::json& args) {
    if (auto err = require_memory(memory_)) return *err;
    if (auto err = require_object_or_absent(args)) return *err;
    if (!has_arg(args, "title") || !has_arg(args, "content")) {
        return ToolResult{false, "Missing title or content arguments"};
    }

    std::optional<std::string> title;
    std::optional<std::string> content;
    if (auto err = read_string(args, "title", title)) return *err;
    if (auto err = read_string(args, "content", content)) return *err;

    try {
        int64_t id = memory_->add(*title, *content);
        return ToolResult{true, "Memory stored successfully with ID: " + std::to_string(id) + "."};
    } catch (const StoreError& e) {
        return store_failure("storing memory", e);
    }
}

std::string RememberTool::description() const {
    return "Store a new memory.";
}

std::string RememberTool::parameters_json() const {
    return R"json({"type":"object","properties":{"title":{"type":"string","description":"A concise title for the memory"},"content":{"type":"string","description":"The full content of the memory to store"}},"required":["title","content"],"title":"rememberArguments"})json";
}

} // namespace memkeep
