#pragma once
#include "server.hpp"
#include "log.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace vlive {

/// Everything needed to start a server, loadable from a JSON document:
///
///   {
///     "transport": "stdio" | "http",
///     "log_level": "info",
///     "server":   {"name", "version", "instructions", "page_size", "builtin_tools"},
///     "dispatch": {"invocation_timeout_ms", "admission_wait_ms", "max_in_flight",
///                  "max_unfinished_per_tool"},
///     "stdio":    {"max_frame_bytes", "pipeline_depth"},
///     "http":     {"host", "port", "mcp_path", "allowed_origins", "max_connections",
///                  "max_body_bytes", "allow_sessionless"}
///   }
///
/// Every key is optional; unknown keys are rejected.
struct ServerConfig {
    enum class Transport { Stdio, Http };

    Transport transport = Transport::Stdio;
    LogLevel log_level = LogLevel::Info;
    Server::Options server;
    StdioTransport::Options stdio;
    HttpServerTransport::Options http;
};

/// Throws ConfigError naming the offending key.
void from_json(const nlohmann::json& j, ServerConfig& config);

/// Parse a config document. Throws ConfigError.
[[nodiscard]] ServerConfig parse_config(const std::string& text);

/// Read and parse a config file. Throws ConfigError.
[[nodiscard]] ServerConfig load_config(const std::string& path);

} // namespace vlive
