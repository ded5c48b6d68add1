#include "tool.hpp"
#include "memory.hpp"
#include "tools/remember.hpp"
#include "tools/get_memory.hpp"
#include "tools/list_memories.hpp"
#include "tools/update_memory.hpp"
#include "tools/delete_memory.hpp"

namespace memkeep {

template <typename T>
static std::unique_ptr<Tool> bind_tool(Memory* memory) {
    auto tool = std::make_unique<T>();
    tool->set_memory(memory);
    return tool;
}

std::vector<std::unique_ptr<Tool>> create_memory_tools(Memory* memory) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(bind_tool<RememberTool>(memory));
    tools.push_back(bind_tool<GetMemoryTool>(memory));
    tools.push_back(bind_tool<ListMemoriesTool>(memory));
    tools.push_back(bind_tool<UpdateMemoryTool>(memory));
    tools.push_back(bind_tool<DeleteMemoryTool>(memory));
    return tools;
}

} // namespace memkeep
