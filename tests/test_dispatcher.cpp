#include <catch2/catch.hpp>
#include "dispatcher.hpp"
#include "memory/sqlite_memory.hpp"
#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <unistd.h>

using namespace memkeep;
using json = nlohmann::json;

static std::string dispatcher_test_path() {
    return "/tmp/memkeep_test_dispatcher_" + std::to_string(getpid()) + ".db";
}

struct DispatcherFixture {
    std::string path = dispatcher_test_path();
    SqliteMemory mem{path};
    std::vector<std::unique_ptr<Tool>> tools = create_memory_tools(&mem);

    ~DispatcherFixture() {
        mem.close();
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }

    ToolResult invoke(const std::string& name, const json& args) {
        return dispatch_tool(name, args, tools);
    }
};

// ── tool table ───────────────────────────────────────────────────

TEST_CASE("create_memory_tools: exposes the five operations", "[dispatcher]") {
    DispatcherFixture f;

    std::vector<std::string> names;
    for (const auto& spec : tool_specs(f.tools)) {
        names.push_back(spec.name);
    }
    REQUIRE(names == std::vector<std::string>{
        "remember", "get_memory", "list_memories", "update_memory", "delete_memory"});
}

TEST_CASE("tool_specs: listing never opens the store", "[dispatcher]") {
    DispatcherFixture f;

    auto specs = tool_specs(f.tools);
    REQUIRE(specs.size() == 5);
    REQUIRE_FALSE(f.mem.is_open());
}

TEST_CASE("tool_descriptor: schemas declare properties and required fields", "[dispatcher]") {
    DispatcherFixture f;

    std::unordered_map<std::string, json> by_name;
    for (const auto& spec : tool_specs(f.tools)) {
        by_name[spec.name] = tool_descriptor(spec);
    }

    auto& remember = by_name["remember"];
    REQUIRE(remember["description"] == "Store a new memory.");
    REQUIRE(remember["inputSchema"]["type"] == "object");
    REQUIRE(remember["inputSchema"]["properties"].contains("title"));
    REQUIRE(remember["inputSchema"]["properties"].contains("content"));
    REQUIRE(remember["inputSchema"]["required"] == json::array({"title", "content"}));

    auto& get = by_name["get_memory"];
    REQUIRE(get["description"] == "Retrieve a specific memory by ID or title.");
    REQUIRE(get["inputSchema"]["properties"]["memory_id"]["type"] == "integer");
    REQUIRE(get["inputSchema"]["properties"]["title"]["type"] == "string");
    REQUIRE_FALSE(get["inputSchema"].contains("required"));

    auto& list = by_name["list_memories"];
    REQUIRE(list["description"] == "List all stored memories.");
    REQUIRE(list["inputSchema"]["properties"].empty());

    auto& update = by_name["update_memory"];
    REQUIRE(update["description"] == "Update an existing memory.");
    REQUIRE(update["inputSchema"]["required"] == json::array({"memory_id"}));
    REQUIRE(update["inputSchema"]["properties"].contains("title"));
    REQUIRE(update["inputSchema"]["properties"].contains("content"));

    auto& del = by_name["delete_memory"];
    REQUIRE(del["description"] == "Delete a memory.");
    REQUIRE(del["inputSchema"]["required"] == json::array({"memory_id"}));
}

// ── dispatch_tool scenarios ──────────────────────────────────────

TEST_CASE("dispatch_tool: remember then get_memory round trip", "[dispatcher]") {
    DispatcherFixture f;

    auto stored = f.invoke("remember", json{{"title", "T"}, {"content", "C"}});
    REQUIRE(stored.success);
    const std::string prefix = "Memory stored successfully with ID: ";
    REQUIRE(stored.output.rfind(prefix, 0) == 0);
    REQUIRE(stored.output.back() == '.');

    std::string id_text = stored.output.substr(prefix.size(),
                                               stored.output.size() - prefix.size() - 1);
    REQUIRE_FALSE(id_text.empty());
    REQUIRE(std::all_of(id_text.begin(), id_text.end(),
                        [](char c) { return c >= '0' && c <= '9'; }));

    auto got = f.invoke("get_memory", json{{"memory_id", std::stoll(id_text)}});
    REQUIRE(got.success);
    REQUIRE(got.output == "Title: T\n\nContent: C");
}

TEST_CASE("dispatch_tool: get_memory with empty arguments", "[dispatcher]") {
    DispatcherFixture f;

    auto result = f.invoke("get_memory", json::object());
    REQUIRE(result.success);
    REQUIRE(result.output == "Error: Please provide either a memory_id or title.");
    REQUIRE_FALSE(f.mem.is_open());
}

TEST_CASE("dispatch_tool: update_memory on unknown id", "[dispatcher]") {
    DispatcherFixture f;

    auto result = f.invoke("update_memory", json{{"memory_id", 999}});
    REQUIRE(result.success);
    REQUIRE(result.output == "Memory with ID 999 not found.");
}

TEST_CASE("dispatch_tool: delete_memory without memory_id", "[dispatcher]") {
    DispatcherFixture f;

    auto result = f.invoke("delete_memory", json::object());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("memory_id") != std::string::npos);
}

TEST_CASE("dispatch_tool: unknown tool", "[dispatcher]") {
    DispatcherFixture f;

    auto result = f.invoke("bogus_tool", json::object());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Unknown tool: bogus_tool");
}

TEST_CASE("dispatch_tool: list_memories ignores absent arguments", "[dispatcher]") {
    DispatcherFixture f;

    REQUIRE(f.invoke("list_memories", json()).output == "No memories stored yet.");

    f.invoke("remember", json{{"title", "Only"}, {"content", "one"}});
    auto result = f.invoke("list_memories", json());
    REQUIRE(result.success);
    REQUIRE(result.output == "Stored Memories:\n\nID: 1 - Only\n");
}

TEST_CASE("dispatch_tool: full lifecycle", "[dispatcher]") {
    DispatcherFixture f;

    REQUIRE(f.invoke("remember", json{{"title", "Draft"}, {"content", "v1"}}).success);

    auto updated = f.invoke("update_memory", json{{"memory_id", 1}, {"content", "v2"}});
    REQUIRE(updated.output == "Memory 1 updated successfully.");
    REQUIRE(f.invoke("get_memory", json{{"title", "Draft"}}).output ==
            "Title: Draft\n\nContent: v2");

    REQUIRE(f.invoke("delete_memory", json{{"memory_id", 1}}).output ==
            "Memory 1 deleted successfully.");
    REQUIRE(f.invoke("get_memory", json{{"memory_id", 1}}).output == "Memory not found.");
    REQUIRE(f.invoke("delete_memory", json{{"memory_id", 1}}).output ==
            "Memory with ID 1 not found.");
}
