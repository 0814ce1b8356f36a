#pragma once
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace collab {

constexpr const char* kServerName = "mcp-collaborator";
constexpr const char* kServerVersion = "0.3.0";
constexpr const char* kProtocolVersion = "2024-11-05";

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Model Context Protocol server over newline-delimited JSON-RPC.
// One message per line in, one response per line out; notifications get no
// response. Logging goes to stderr so stdout carries only protocol traffic.
class McpServer {
public:
    explicit McpServer(std::vector<std::unique_ptr<Tool>> tools);

    // Handle one raw message. Returns nullopt when no response is due.
    std::optional<nlohmann::json> handle_message(const std::string& line);

    // Serve until `in` reaches EOF
    void run(std::istream& in, std::ostream& out);

    const std::vector<std::unique_ptr<Tool>>& tools() const { return tools_; }

private:
    nlohmann::json initialize_result(const nlohmann::json& params) const;
    nlohmann::json list_tools() const;
    std::optional<nlohmann::json> call_tool(const nlohmann::json& id, const nlohmann::json& params);

    std::vector<std::unique_ptr<Tool>> tools_;
};

nlohmann::json make_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

} // namespace collab
