#pragma once

#include <ea_mcp/mcp/mcp_server.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace ea_mcp {

// ---------------------------------------------------------------------------
// McpHttpServer — the McpServer message handling over HTTP.
//
//   POST /mcp     one JSON-RPC message in the body; the response in the body
//                 (204 No Content for notifications)
//   GET  /health  {"status":"ok","tools":N}
//
// cpp-httplib serves on a thread pool; messages are handled one at a time
// under a mutex, so the shared session sees one tool call at a time.
// Uses pimpl to keep httplib out of the public header.
// ---------------------------------------------------------------------------
class McpHttpServer {
public:
    explicit McpHttpServer(ToolRegistry registry);
    ~McpHttpServer();

    McpHttpServer(const McpHttpServer&) = delete;
    McpHttpServer& operator=(const McpHttpServer&) = delete;

    // Bind and serve until Stop(). Returns false if the address cannot be
    // bound.
    bool Listen(const std::string& host, int port);

    // Bind to an OS-assigned port; returns it, or -1 on failure. Serve with
    // ListenAfterBind().
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();

    void WaitUntilReady() const;
    void Stop();

    // Handle one request body as the POST /mcp endpoint would. Empty result
    // for notifications.
    [[nodiscard]] std::string HandleBody(const std::string& body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ea_mcp
