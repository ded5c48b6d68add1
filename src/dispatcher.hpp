#pragma once
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace memkeep {

// Execute a single tool call, finding the tool by name.
// arguments is null when the caller supplied none.
ToolResult dispatch_tool(const std::string& name, const nlohmann::json& arguments,
                         const std::vector<std::unique_ptr<Tool>>& tools);

// Capability listing. Never touches the store.
std::vector<ToolSpec> tool_specs(const std::vector<std::unique_ptr<Tool>>& tools);

// Render a spec as an MCP tool descriptor: {name, description, inputSchema}
nlohmann::json tool_descriptor(const ToolSpec& spec);

} // namespace memkeep
