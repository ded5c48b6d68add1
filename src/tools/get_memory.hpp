#pragma once
#include "../memory.hpp"

namespace memkeep {

class GetMemoryTool : public MemoryAwareTool {
public:
    ToolResult execute(const nlohmann::json& args) override;
    std::string tool_name() const override { return "get_memory"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace memkeep
