#include <ea_mcp/mcp/mcp_server.hpp>

#include <ea_mcp/core/log.hpp>
#include <ea_mcp/core/version.hpp>

#include <optional>
#include <string>

namespace ea_mcp {

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "Serving " + std::to_string(registry_.Tools().size()) +
                       " tools on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        auto response = HandleLine(line);
        if (response) {
            out_ << response->dump() << "\n";
            out_.flush();
        }
    }
    LogInfo("mcp", "stdin closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleLine(const std::string& line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        LogWarn("mcp", std::string("Parse error: ") + e.what());
        return MakeJsonRpcError(nullptr, kJsonRpcParseError, "Parse error");
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeJsonRpcError(nullptr, kJsonRpcInvalidRequest, "Invalid Request");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeJsonRpcError(message["id"], kJsonRpcInvalidRequest,
                                    "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    bool is_notification = !message.contains("id");
    std::string method;
    if (message.contains("method") && message["method"].is_string()) {
        method = message["method"].get<std::string>();
    }
    auto params = message.value("params", nlohmann::json::object());

    if (is_notification) {
        LogDebug("mcp", "Notification: " + method);
        return std::nullopt;
    }

    auto id = message["id"];
    LogDebug("mcp", "Request " + id.dump() + ": " + method);

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "ping") {
        return MakeJsonRpcResult(id, nlohmann::json::object());
    } else {
        return MakeJsonRpcError(id, kJsonRpcMethodNotFound,
                                "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    if (params.is_object() && params.contains("clientInfo") &&
        params["clientInfo"].is_object()) {
        LogInfo("mcp", "Client: " + params["clientInfo"].value("name", "?") + " " +
                           params["clientInfo"].value("version", ""));
    }

    nlohmann::json result;
    result["protocolVersion"] = kMcpProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "ea-mcp"},
        {"version", kVersion}
    };

    return MakeJsonRpcResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeJsonRpcResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name")) {
        return MakeJsonRpcError(id, kJsonRpcInvalidParams, "Missing 'name' parameter");
    }
    if (!params["name"].is_string()) {
        return MakeJsonRpcError(id, kJsonRpcInvalidParams,
                                "Parameter 'name' must be a string");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    if (!registry_.HasTool(tool_name)) {
        return MakeJsonRpcError(id, kJsonRpcInvalidParams, "Unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }

    return MakeJsonRpcResult(id, response_result);
}

nlohmann::json MakeJsonRpcError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json MakeJsonRpcResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace ea_mcp
