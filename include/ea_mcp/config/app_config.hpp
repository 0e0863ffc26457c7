#pragma once

#include <ea_mcp/core/log.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ea_mcp {

enum class TransportMode {
    Stdio,
    Http,
};

// "stdio" or "http".
std::optional<TransportMode> ParseTransportMode(std::string_view name);
std::string_view TransportModeName(TransportMode mode);

struct RepositoryConfig {
    std::string path;
    std::string path_env = "EA_FILE_PATH";  // consulted when path is empty
    bool create_if_missing = false;
};

struct TransportConfig {
    TransportMode mode = TransportMode::Stdio;
    std::string host = "127.0.0.1";
    uint16_t port = 8765;
};

struct LoggingConfig {
    std::optional<std::string> file;  // JSON lines when set; stderr otherwise
    bool json = false;
    LogLevel level = LogLevel::Warn;
    std::optional<bool> color;        // nullopt: auto-detect from the terminal
};

// Transport flags given on the command line. They override the YAML file
// even when their value equals the built-in default.
struct CliPresence {
    bool transport_mode = false;
    bool transport_host = false;
    bool transport_port = false;
};

struct AppConfig {
    std::optional<std::string> config_file;
    RepositoryConfig repository;
    TransportConfig transport;
    LoggingConfig logging;
    bool show_version = false;
    CliPresence cli_given;
};

} // namespace ea_mcp
