#pragma once
#include "../memory.hpp"

namespace memkeep {

class UpdateMemoryTool : public MemoryAwareTool {
public:
    ToolResult execute(const nlohmann::json& args) override;
    std::string tool_name() const override { return "update_memory"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace memkeep
