#include <ea_mcp/config/config_loader.hpp>

#include <ea_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace ea_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Config(message);
}

constexpr uint16_t kDefaultPort = 8765;

Result<void, Error> ApplyLevel(const std::string& text, LoggingConfig& logging) {
    auto level = ParseLogLevel(text);
    if (!level) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid log level '" + text + "' (expected debug, info, warn, error)"));
    }
    logging.level = *level;
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyMode(const std::string& text, TransportConfig& transport) {
    auto mode = ParseTransportMode(text);
    if (!mode) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid transport '" + text + "' (expected stdio or http)"));
    }
    transport.mode = *mode;
    return Result<void, Error>::Ok();
}

Result<uint16_t, Error> CheckPort(int port) {
    if (port < 0 || port > 65535) {
        return Result<uint16_t, Error>::Err(
            MakeConfigError("Port out of range: " + std::to_string(port)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(port));
}

} // anonymous namespace

std::optional<TransportMode> ParseTransportMode(std::string_view name) {
    if (name == "stdio") return TransportMode::Stdio;
    if (name == "http") return TransportMode::Http;
    return std::nullopt;
}

std::string_view TransportModeName(TransportMode mode) {
    switch (mode) {
        case TransportMode::Stdio: return "stdio";
        case TransportMode::Http:  return "http";
    }
    return "stdio";
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        // -- Repository --
        if (root["repository"]) {
            const auto& repo = root["repository"];
            if (repo["path"]) {
                config.repository.path = repo["path"].as<std::string>();
            }
            if (repo["path_env"]) {
                config.repository.path_env = repo["path_env"].as<std::string>();
            }
            if (repo["create_if_missing"]) {
                config.repository.create_if_missing = repo["create_if_missing"].as<bool>();
            }
        }

        // -- Transport --
        if (root["transport"]) {
            const auto& transport = root["transport"];
            if (transport["mode"]) {
                auto applied = ApplyMode(transport["mode"].as<std::string>(),
                                         config.transport);
                if (applied.IsErr()) {
                    return Result<AppConfig, Error>::Err(applied.Error());
                }
            }
            if (transport["host"]) {
                config.transport.host = transport["host"].as<std::string>();
            }
            if (transport["port"]) {
                auto port = CheckPort(transport["port"].as<int>());
                if (port.IsErr()) {
                    return Result<AppConfig, Error>::Err(port.Error());
                }
                config.transport.port = port.Value();
            }
        }

        // -- Logging --
        if (root["logging"]) {
            const auto& logging = root["logging"];
            if (logging["file"]) {
                config.logging.file = logging["file"].as<std::string>();
            }
            if (logging["json"]) {
                config.logging.json = logging["json"].as<bool>();
            }
            if (logging["level"]) {
                auto applied = ApplyLevel(logging["level"].as<std::string>(),
                                          config.logging);
                if (applied.IsErr()) {
                    return Result<AppConfig, Error>::Err(applied.Error());
                }
            }
            if (logging["color"]) {
                config.logging.color = logging["color"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // -v is verbosity here, so only --help is added automatically.
    argparse::ArgumentParser program("ea-mcp", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Repository
    program.add_argument("--repository")
        .help("Path to the model repository file (default: $EA_FILE_PATH)");
    program.add_argument("--create")
        .help("Create the repository file if it does not exist")
        .default_value(false)
        .implicit_value(true);

    // Transport
    program.add_argument("--transport")
        .help("Transport: stdio or http");
    program.add_argument("--host")
        .help("HTTP bind address");
    program.add_argument("--port")
        .help("HTTP port")
        .scan<'i', int>();

    // Logging
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file instead of stderr");
    program.add_argument("--json-logs")
        .help("JSON log lines on stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Info-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv", "--debug")
        .help("Debug-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }

    // Repository
    if (auto val = program.present("--repository")) {
        config.repository.path = *val;
    }
    if (program.get<bool>("--create")) {
        config.repository.create_if_missing = true;
    }

    // Transport
    if (auto val = program.present("--transport")) {
        auto applied = ApplyMode(*val, config.transport);
        if (applied.IsErr()) {
            return Result<AppConfig, Error>::Err(applied.Error());
        }
        config.cli_given.transport_mode = true;
    }
    if (auto val = program.present("--host")) {
        config.transport.host = *val;
        config.cli_given.transport_host = true;
    }
    if (auto val = program.present<int>("--port")) {
        auto port = CheckPort(*val);
        if (port.IsErr()) {
            return Result<AppConfig, Error>::Err(port.Error());
        }
        config.transport.port = port.Value();
        config.cli_given.transport_port = true;
    }

    // Logging
    if (auto val = program.present("--log-file")) {
        config.logging.file = *val;
    }
    if (program.get<bool>("--json-logs")) {
        config.logging.json = true;
    }
    if (program.get<bool>("--debug")) {
        config.logging.level = LogLevel::Debug;
    } else if (program.get<bool>("--verbose")) {
        config.logging.level = LogLevel::Info;
    }
    if (program.get<bool>("--color") && program.get<bool>("--no-color")) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    if (program.get<bool>("--color")) {
        config.logging.color = true;
    } else if (program.get<bool>("--no-color")) {
        config.logging.color = false;
    }

    config.show_version = program.get<bool>("--version");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const AppConfig defaults;

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    // Repository overrides
    if (!cli_overrides.repository.path.empty()) {
        merged.repository.path = cli_overrides.repository.path;
    }
    if (cli_overrides.repository.path_env != defaults.repository.path_env) {
        merged.repository.path_env = cli_overrides.repository.path_env;
    }
    if (cli_overrides.repository.create_if_missing) {
        merged.repository.create_if_missing = true;
    }

    // Transport overrides
    const auto& given = cli_overrides.cli_given;
    if (given.transport_mode ||
        cli_overrides.transport.mode != defaults.transport.mode) {
        merged.transport.mode = cli_overrides.transport.mode;
    }
    if (given.transport_host ||
        cli_overrides.transport.host != defaults.transport.host) {
        merged.transport.host = cli_overrides.transport.host;
    }
    if (given.transport_port || cli_overrides.transport.port != kDefaultPort) {
        merged.transport.port = cli_overrides.transport.port;
    }

    // Logging overrides
    if (cli_overrides.logging.file.has_value()) {
        merged.logging.file = cli_overrides.logging.file;
    }
    if (cli_overrides.logging.json) {
        merged.logging.json = true;
    }
    if (cli_overrides.logging.level != defaults.logging.level) {
        merged.logging.level = cli_overrides.logging.level;
    }
    if (cli_overrides.logging.color.has_value()) {
        merged.logging.color = cli_overrides.logging.color;
    }

    if (cli_overrides.show_version) {
        merged.show_version = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveRepositoryPathEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveRepositoryPathEnv(AppConfig config) {
    if (config.repository.path.empty() && !config.repository.path_env.empty()) {
        const auto& env_var = config.repository.path_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val != nullptr) {
            if (*env_val == '\0') {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Environment variable '" + env_var +
                                    "' is empty (specified by path_env)"));
            }
            config.repository.path = env_val;
        }
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.repository.path.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing required field: repository.path (or set " +
            (config.repository.path_env.empty() ? std::string("path_env")
                                                : config.repository.path_env) +
            ")"));
    }
    if (config.transport.mode == TransportMode::Http) {
        if (config.transport.host.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Missing required field: transport.host"));
        }
        if (config.transport.port == 0) {
            return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
        }
    }
    if (config.logging.file.has_value() && config.logging.file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("logging.file must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace ea_mcp
