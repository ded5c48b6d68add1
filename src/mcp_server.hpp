#pragma once
#include "config.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace memkeep {

class Memory; // forward declaration

// JSON-RPC 2.0 error codes
namespace rpc_error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";

// Model Context Protocol server: newline-delimited JSON-RPC 2.0 over a
// pair of streams (stdin/stdout in production). Requests are handled one
// at a time, in order.
class McpServer {
public:
    McpServer(Memory& memory, ServerConfig info);

    // Read requests until EOF, shutdown or the abort flag is raised, then
    // close the store connection.
    void run(std::istream& in, std::ostream& out);

    // Handle one decoded request. Returns null for notifications.
    nlohmann::json handle_request(const nlohmann::json& request);

    // Handle one raw input line. Returns the serialized response, or an
    // empty string when nothing should be written.
    std::string handle_line(const std::string& line);

    void stop() { running_ = false; }
    bool running() const { return running_; }

    // Checked between requests; must outlive run().
    void set_abort_flag(const std::atomic<bool>* flag) { abort_flag_ = flag; }

    const std::vector<std::unique_ptr<Tool>>& tools() const { return tools_; }

private:
    nlohmann::json handle_initialize(const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json handle_tools_list(const nlohmann::json& id);
    nlohmann::json handle_tools_call(const nlohmann::json& params, const nlohmann::json& id);

    static nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json make_error(const nlohmann::json& id, int code,
                                     const std::string& message);

    Memory& memory_;
    ServerConfig info_;
    std::vector<std::unique_ptr<Tool>> tools_;
    std::atomic<bool> running_{false};
    const std::atomic<bool>* abort_flag_ = nullptr;
};

} // namespace memkeep
