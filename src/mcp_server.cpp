#include "mcp_server.hpp"
#include "dispatcher.hpp"
#include <iostream>
#include <utility>

namespace collab {

using json = nlohmann::json;

json make_response(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

McpServer::McpServer(std::vector<std::unique_ptr<Tool>> tools)
    : tools_(std::move(tools)) {}

json McpServer::initialize_result(const json& params) const {
    std::string protocol = kProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        protocol = params["protocolVersion"].get<std::string>();
    }
    return {
        {"protocolVersion", protocol},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
    };
}

json McpServer::list_tools() const {
    json list = json::array();
    for (const auto& tool : tools_) {
        ToolSpec spec = tool->spec();
        list.push_back({
            {"name", spec.name},
            {"description", spec.description},
            {"inputSchema", json::parse(spec.parameters_json)}
        });
    }
    return {{"tools", list}};
}

std::optional<json> McpServer::call_tool(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, kInvalidParams, "tools/call requires a string 'name'");
    }
    std::string name = params["name"].get<std::string>();
    json arguments = params.value("arguments", json::object());
    if (!arguments.is_object()) {
        return make_error(id, kInvalidParams, "'arguments' must be an object");
    }
    if (!find_tool(name, tools_)) {
        return make_error(id, kInvalidParams, "Unknown tool: " + name);
    }

    std::cerr << "[server] Calling tool: " << name << "\n";
    ToolResult result = dispatch_tool(name, arguments.dump(), tools_);
    return make_response(id, {
        {"content", json::array({{{"type", "text"}, {"text", result.output}}})},
        {"isError", !result.success}
    });
}

std::optional<json> McpServer::handle_message(const std::string& line) {
    json req;
    try {
        req = json::parse(line);
    } catch (const json::parse_error& e) {
        return make_error(nullptr, kParseError, std::string("Parse error: ") + e.what());
    }
    if (!req.is_object()) {
        return make_error(nullptr, kInvalidRequest, "Request must be a JSON object");
    }

    bool is_notification = !req.contains("id");
    json id = req.value("id", json(nullptr));
    if (!req.contains("method") || !req["method"].is_string()) {
        if (is_notification) return std::nullopt;
        return make_error(id, kInvalidRequest, "Missing method");
    }
    std::string method = req["method"].get<std::string>();
    json params = req.value("params", json::object());

    if (is_notification) return std::nullopt;

    try {
        if (method == "initialize") {
            return make_response(id, initialize_result(params));
        }
        if (method == "ping") {
            return make_response(id, json::object());
        }
        if (method == "tools/list") {
            return make_response(id, list_tools());
        }
        if (method == "tools/call") {
            return call_tool(id, params);
        }
    } catch (const std::exception& e) {
        std::cerr << "[server] " << method << " failed: " << e.what() << "\n";
        return make_error(id, kInternalError, e.what());
    }

    return make_error(id, kMethodNotFound, "Method not found: " + method);
}

void McpServer::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        auto response = handle_message(line);
        if (!response) continue;
        // Tool output (git diffs in particular) is not guaranteed to be UTF-8
        out << response->dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
        out.flush();
    }
    std::cerr << "[server] Input closed, shutting down\n";
}

} // namespace collab
