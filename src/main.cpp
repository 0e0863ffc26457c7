#include <ea_mcp/config/config_loader.hpp>
#include <ea_mcp/core/log.hpp>
#include <ea_mcp/core/terminal.hpp>
#include <ea_mcp/core/version.hpp>
#include <ea_mcp/ea/xml_repository_session.hpp>
#include <ea_mcp/mcp/mcp_http_server.hpp>
#include <ea_mcp/mcp/mcp_server.hpp>
#include <ea_mcp/mcp/mcp_tool_handlers.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

// Load the YAML file named by --config (if any) under the CLI flags, then
// resolve the repository path from the environment and validate.
ea_mcp::Result<ea_mcp::AppConfig, ea_mcp::Error> LoadConfig(
    int argc, const char* const* argv) {
    using namespace ea_mcp;
    using R = Result<AppConfig, Error>;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }
    AppConfig config = std::move(cli).Value();
    if (config.show_version) {
        return R::Ok(std::move(config));
    }

    if (config.config_file.has_value()) {
        auto yaml = LoadFromYaml(*config.config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = MergeConfigs(yaml.Value(), config);
    }

    auto resolved = ResolveRepositoryPathEnv(std::move(config));
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return resolved;
}

// stderr console (colored when it is a terminal) unless a log file or JSON
// output is requested. stdout is reserved for the stdio transport.
void InitLogging(const ea_mcp::LoggingConfig& logging) {
    using namespace ea_mcp;

    if (logging.file.has_value()) {
        static std::ofstream log_stream;
        log_stream.open(*logging.file, std::ios::app);
        if (log_stream) {
            InitGlobalLogger(std::make_unique<JsonSink>(log_stream), logging.level);
            return;
        }
        std::cerr << "Warning: cannot open log file '" << *logging.file
                  << "', logging to stderr\n";
    }
    if (logging.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), logging.level);
        return;
    }

    bool use_color = logging.color.has_value()
                         ? *logging.color
                         : (!NoColorEnvSet() && IsStderrTty());
    InitGlobalLogger(std::make_unique<ConsoleSink>(use_color), logging.level);
}

int RunHttp(ea_mcp::ToolRegistry registry, const ea_mcp::TransportConfig& transport) {
    using namespace ea_mcp;

    McpHttpServer server(std::move(registry));
    if (!server.Listen(transport.host, transport.port)) {
        auto error = Error::Config("Cannot listen on " + transport.host + ":" +
                                   std::to_string(transport.port));
        LogError("main", error.ToString());
        std::cerr << "Error: " << error.message << "\n";
        return error.ExitCode();
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace ea_mcp;

    auto config_result = LoadConfig(argc, argv);
    if (config_result.IsErr()) {
        const auto& error = config_result.Error();
        std::cerr << "Error: " << error.message << "\n";
        return error.ExitCode();
    }
    const AppConfig config = std::move(config_result).Value();

    if (config.show_version) {
        std::cout << "ea-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    InitLogging(config.logging);
    LogInfo("main", std::string("ea-mcp ") + kVersion + " starting (" +
                        std::string(TransportModeName(config.transport.mode)) + ")");

    XmlRepositoryOptions options;
    options.create_if_missing = config.repository.create_if_missing;
    auto session_result = XmlRepositorySession::Open(config.repository.path, options);
    if (session_result.IsErr()) {
        const auto& error = session_result.Error();
        LogError("main", error.ToString());
        std::cerr << "Error: " << error.message << "\n";
        return error.ExitCode();
    }
    auto session = std::move(session_result).Value();

    for (const auto& package : session->ListPackages()) {
        LogInfo("main", "Package " + package.guid + " '" + package.name + "'");
    }

    // Create tool registry and register all EA tools. The session outlives
    // both the registry and the server.
    ToolRegistry registry;
    RegisterEaTools(registry, *session);

    if (config.transport.mode == TransportMode::Http) {
        return RunHttp(std::move(registry), config.transport);
    }

    // Run the stdio MCP server (blocks until EOF on stdin).
    McpServer server(std::move(registry));
    server.Run();
    return kExitSuccess;
}
