#include "dispatcher.hpp"
#include <nlohmann/json.hpp>

namespace memkeep {

ToolResult dispatch_tool(const std::string& name, const nlohmann::json& arguments,
                         const std::vector<std::unique_ptr<Tool>>& tools) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == name) {
            return tool->execute(arguments);
        }
    }
    return ToolResult{false, "Unknown tool: " + name};
}

std::vector<ToolSpec> tool_specs(const std::vector<std::unique_ptr<Tool>>& tools) {
    std::vector<ToolSpec> specs;
    specs.reserve(tools.size());
    for (const auto& tool : tools) {
        specs.push_back(tool->spec());
    }
    return specs;
}

nlohmann::json tool_descriptor(const ToolSpec& spec) {
    return {
        {"name", spec.name},
        {"description", spec.description},
        {"inputSchema", nlohmann::json::parse(spec.parameters_json)}
    };
}

} // namespace memkeep
