#include "list_memories.hpp"
#include "tool_util.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace memkeep {

ToolResult ListMemoriesTool::execute(const nlohmann::json& /*args*/) {
    if (auto err = require_memory(memory_)) return *err;

    std::vector<MemorySummary> memories;
    try {
        memories = memory_->list();
    } catch (const StoreError& e) {
        return store_failure("listing memories", e);
    }

    if (memories.empty()) {
        return ToolResult{true, "No memories stored yet."};
    }

    std::ostringstream ss;
    ss << "Stored Memories:\n\n";
    for (const auto& m : memories) {
        ss << "ID: " << m.id << " - " << m.title << "\n";
    }
    return ToolResult{true, ss.str()};
}

std::string ListMemoriesTool::description() const {
    return "List all stored memories.";
}

std::string ListMemoriesTool::parameters_json() const {
    return R"json({"type":"object","properties":{},"title":"listMemoriesArguments"})json";
}

} // namespace memkeep
