#include <ea_mcp/mcp/mcp_http_server.hpp>

#include <ea_mcp/core/log.hpp>

#include <httplib.h>

#include <sstream>

namespace ea_mcp {

namespace {
constexpr const char* kJsonContentType = "application/json";
} // namespace

struct McpHttpServer::Impl {
    explicit Impl(ToolRegistry registry)
        : server(std::move(registry), null_in, null_out) {}

    std::istringstream null_in;
    std::ostringstream null_out;
    McpServer server;
    std::mutex mutex;
    httplib::Server http;
};

McpHttpServer::McpHttpServer(ToolRegistry registry)
    : impl_(std::make_unique<Impl>(std::move(registry))) {
    impl_->http.Post("/mcp", [this](const httplib::Request& req,
                                    httplib::Response& res) {
        auto body = HandleBody(req.body);
        if (body.empty()) {
            res.status = 204;
            return;
        }
        res.set_content(body, kJsonContentType);
    });

    impl_->http.Get("/health", [this](const httplib::Request&,
                                      httplib::Response& res) {
        nlohmann::json health = {
            {"status", "ok"},
            {"tools", impl_->server.Registry().Tools().size()},
        };
        res.set_content(health.dump(), kJsonContentType);
    });

    impl_->http.set_logger([](const httplib::Request& req,
                              const httplib::Response& res) {
        LogDebug("http", req.method + " " + req.path + " -> " +
                             std::to_string(res.status));
    });
}

McpHttpServer::~McpHttpServer() {
    Stop();
}

bool McpHttpServer::Listen(const std::string& host, int port) {
    LogInfo("http", "Listening on " + host + ":" + std::to_string(port));
    return impl_->http.listen(host, port);
}

int McpHttpServer::BindToAnyPort(const std::string& host) {
    return impl_->http.bind_to_any_port(host);
}

bool McpHttpServer::ListenAfterBind() {
    return impl_->http.listen_after_bind();
}

void McpHttpServer::WaitUntilReady() const {
    impl_->http.wait_until_ready();
}

void McpHttpServer::Stop() {
    if (impl_->http.is_running()) {
        impl_->http.stop();
    }
}

std::string McpHttpServer::HandleBody(const std::string& body) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto response = impl_->server.HandleLine(body);
    if (!response) {
        return {};
    }
    return response->dump();
}

} // namespace ea_mcp
