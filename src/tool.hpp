#pragma once
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace memkeep {

class Memory; // forward declaration

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

// success == false flags a malformed invocation (protocol-level error).
// Business outcomes such as "not found" are successful results whose
// output text says so.
struct ToolResult {
    bool success;
    std::string output;
};

class Tool {
public:
    virtual ~Tool() = default;

    // args is the argument mapping, or null when the caller sent none.
    virtual ToolResult execute(const nlohmann::json& args) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Create the five memory tools, all bound to the given store.
std::vector<std::unique_ptr<Tool>> create_memory_tools(Memory* memory);

} // namespace memkeep
