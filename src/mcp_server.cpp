#include "mcp_server.hpp"
#include "dispatcher.hpp"
#include "memory.hpp"
#include <iostream>
#include <utility>

namespace memkeep {

using json = nlohmann::json;

McpServer::McpServer(Memory& memory, ServerConfig info)
    : memory_(memory)
    , info_(std::move(info))
    , tools_(create_memory_tools(&memory)) {}

void McpServer::run(std::istream& in, std::ostream& out) {
    running_ = true;
    std::string line;

    while (running_ && std::getline(in, line)) {
        if (abort_flag_ && abort_flag_->load()) break;

        std::string response = handle_line(line);
        if (!response.empty()) {
            out << response << "\n";
            out.flush();
        }
    }

    running_ = false;
    memory_.close();
    std::cerr << "[mcp] Session ended, store connection closed.\n";
}

std::string McpServer::handle_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return {};

    json response;
    try {
        response = handle_request(json::parse(line));
    } catch (const json::parse_error& e) {
        response = make_error(nullptr, rpc_error::PARSE_ERROR,
                              std::string("Parse error: ") + e.what());
    }
    if (response.is_null()) return {};

    // Stored text is not guaranteed to be valid UTF-8
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

json McpServer::handle_request(const json& request) {
    if (!request.is_object()) {
        return make_error(nullptr, rpc_error::INVALID_REQUEST, "Request must be an object");
    }

    json id = request.value("id", json());
    bool is_notification = !request.contains("id");

    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return make_error(id, rpc_error::INVALID_REQUEST,
                          "Missing or invalid jsonrpc version");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing or invalid method");
    }

    std::string method = request["method"].get<std::string>();

    // Notifications never get a response
    if (is_notification) {
        if (method == "exit") running_ = false;
        return json();
    }

    json params = request.value("params", json::object());
    if (!params.is_object()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "params must be an object");
    }

    try {
        if (method == "initialize") {
            return handle_initialize(params, id);
        } else if (method == "ping") {
            return make_result(id, json::object());
        } else if (method == "tools/list") {
            return handle_tools_list(id);
        } else if (method == "tools/call") {
            return handle_tools_call(params, id);
        } else if (method == "shutdown") {
            running_ = false;
            return make_result(id, json::object());
        }
    } catch (const std::exception& e) {
        std::cerr << "[mcp] " << method << " failed: " << e.what() << "\n";
        return make_error(id, rpc_error::INTERNAL_ERROR,
                          std::string("Internal error: ") + e.what());
    }

    return make_error(id, rpc_error::METHOD_NOT_FOUND, "Unknown method: " + method);
}

json McpServer::handle_initialize(const json& params, const json& id) {
    std::string version = DEFAULT_PROTOCOL_VERSION;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }

    json result = {
        {"protocolVersion", version},
        {"capabilities", {
            {"tools", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    };
    return make_result(id, result);
}

json McpServer::handle_tools_list(const json& id) {
    json tools_array = json::array();
    for (const auto& spec : tool_specs(tools_)) {
        tools_array.push_back(tool_descriptor(spec));
    }
    return make_result(id, {{"tools", tools_array}});
}

json McpServer::handle_tools_call(const json& params, const json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Missing tool name");
    }

    std::string name = params["name"].get<std::string>();
    // Absent arguments stay null so tools can tell them apart from {}
    json arguments = params.contains("arguments") ? params["arguments"] : json();

    ToolResult result = dispatch_tool(name, arguments, tools_);
    if (!result.success) {
        std::cerr << "[mcp] " << name << ": " << result.output << "\n";
    }

    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", result.output}
    });
    return make_result(id, {
        {"content", content},
        {"isError", !result.success}
    });
}

json McpServer::make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json McpServer::make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace memkeep
