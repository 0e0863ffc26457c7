#pragma once

#include <ea_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ea_mcp {

// JSON-RPC 2.0 error codes.
constexpr int kJsonRpcParseError = -32700;
constexpr int kJsonRpcInvalidRequest = -32600;
constexpr int kJsonRpcMethodNotFound = -32601;
constexpr int kJsonRpcInvalidParams = -32602;

constexpr const char* kMcpProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - tools/list
//   - tools/call
//   - ping
//   - notifications/* (no response)
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on stdin).
    void Run();

    // Process one raw message line. Malformed JSON yields a parse error
    // response; notifications yield nullopt.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(const std::string& line);

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

[[nodiscard]] nlohmann::json MakeJsonRpcError(const nlohmann::json& id,
                                              int code, const std::string& message);
[[nodiscard]] nlohmann::json MakeJsonRpcResult(const nlohmann::json& id,
                                               const nlohmann::json& result);

} // namespace ea_mcp
