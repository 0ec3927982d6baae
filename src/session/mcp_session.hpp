#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "runtime/dispatcher.hpp"
#include "runtime/tool_registry.hpp"

namespace winsys::session {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "windows-system-mcp";
constexpr const char* kServerVersion = "1.0.0";

namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
}  // namespace rpc_error

// MCP server over newline-delimited JSON-RPC 2.0. Requests are served one at a
// time, in arrival order.
class McpSession {
public:
    McpSession(const runtime::ToolRegistry& registry, const runtime::Dispatcher& dispatcher);

    // Serves until `in` reaches EOF. Returns the number of responses written.
    std::size_t run(std::istream& in, std::ostream& out) const;

    // nullopt when the line calls for no response (blank line, notification,
    // or a client-side response).
    std::optional<nlohmann::json> handle_line(const std::string& line) const;
    std::optional<nlohmann::json> handle_message(const nlohmann::json& message) const;

private:
    nlohmann::json initialize_result() const;
    nlohmann::json call_tool(const nlohmann::json& id, const nlohmann::json& params) const;

    const runtime::ToolRegistry& registry_;
    const runtime::Dispatcher& dispatcher_;
};

nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

// Serializes for the wire; invalid UTF-8 from command output is replaced, not thrown.
std::string to_wire(const nlohmann::json& message);

}  // namespace winsys::session
