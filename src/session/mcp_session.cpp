#include "session/mcp_session.hpp"

#include <istream>
#include <ostream>
#include "core/logging/logger.hpp"

namespace winsys::session {

using nlohmann::json;

json make_result(const json& id, const json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json make_error(const json& id, const int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

std::string to_wire(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

McpSession::McpSession(const runtime::ToolRegistry& registry,
                       const runtime::Dispatcher& dispatcher)
    : registry_(registry), dispatcher_(dispatcher) {}

std::size_t McpSession::run(std::istream& in, std::ostream& out) const {
    WINSYS_LOG_INFO("MCP server listening on stdio");
    std::size_t responses = 0;
    std::string line;
    while (std::getline(in, line)) {
        const auto response = handle_line(line);
        if (!response) {
            continue;
        }
        out << to_wire(*response) << '\n';
        out.flush();
        ++responses;
    }
    WINSYS_LOG_INFO("Input closed after " + std::to_string(responses) + " responses");
    return responses;
}

std::optional<json> McpSession::handle_line(const std::string& line) const {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    if (text.find_first_not_of(" \t") == std::string::npos) {
        return std::nullopt;
    }

    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& ex) {
        WINSYS_LOG_WARN(std::string("Malformed JSON-RPC message: ") + ex.what());
        return make_error(nullptr, rpc_error::kParseError, std::string("Parse error: ") + ex.what());
    }
    return handle_message(message);
}

std::optional<json> McpSession::handle_message(const json& message) const {
    if (!message.is_object()) {
        return make_error(nullptr, rpc_error::kInvalidRequest, "Expected JSON object");
    }

    const bool has_method = message.contains("method") && message["method"].is_string();
    const bool has_id = message.contains("id");
    if (!has_method) {
        if (message.contains("result") || message.contains("error")) {
            return std::nullopt;
        }
        return make_error(message.value("id", json(nullptr)), rpc_error::kInvalidRequest,
                          "Missing 'method' field");
    }

    const std::string method = message["method"].get<std::string>();
    if (!has_id || method.rfind("notifications/", 0) == 0) {
        WINSYS_LOG_DEBUG("Notification: " + method);
        return std::nullopt;
    }

    const json& id = message["id"];
    const json params = message.contains("params") && message["params"].is_object()
                            ? message["params"]
                            : json::object();
    WINSYS_LOG_DEBUG("RPC request: " + method);

    if (method == "initialize") {
        return make_result(id, initialize_result());
    }
    if (method == "ping") {
        return make_result(id, json::object());
    }
    if (method == "tools/list") {
        return make_result(id, {{"tools", registry_.describe()}});
    }
    if (method == "tools/call") {
        return call_tool(id, params);
    }
    return make_error(id, rpc_error::kMethodNotFound, "Method not found: " + method);
}

json McpSession::initialize_result() const {
    return {{"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}};
}

json McpSession::call_tool(const json& id, const json& params) const {
    if (!params.contains("name") || !params["name"].is_string()) {
        return make_error(id, rpc_error::kInvalidParams, "Missing tool name");
    }

    protocol::ToolCall call;
    call.name = params["name"].get<std::string>();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        call.arguments = params["arguments"];
    }
    return make_result(id, protocol::to_call_result(dispatcher_.handle(call)));
}

}  // namespace winsys::session
