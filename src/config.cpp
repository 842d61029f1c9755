#include "vlive/config.hpp"
#include "vlive/error.hpp"
#include <chrono>
#include <fstream>
#include <initializer_list>
#include <sstream>

namespace vlive {

namespace {

const nlohmann::json* section(const nlohmann::json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("'") + name + "' must be an object");
    }
    return &*it;
}

void reject_unknown(const nlohmann::json& j, const std::string& where,
                    std::initializer_list<const char*> known) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool found = false;
        for (const char* k : known) {
            if (it.key() == k) { found = true; break; }
        }
        if (!found) {
            throw ConfigError("Unknown config key: " + where + it.key());
        }
    }
}

template <typename T>
void read(const nlohmann::json& j, const std::string& where, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError("Invalid type for config key: " + where + key);
    }
}

// Rejects negative numbers, which get<size_t>() would silently wrap
void read_count(const nlohmann::json& j, const std::string& where, const char* key, size_t& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_unsigned()) {
        throw ConfigError("Config key " + where + key + " must be a non-negative integer");
    }
    out = it->get<size_t>();
}

} // anonymous namespace

void from_json(const nlohmann::json& j, ServerConfig& config) {
    if (!j.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }
    reject_unknown(j, "", {"transport", "log_level", "server", "dispatch", "stdio", "http"});

    if (j.contains("transport")) {
        std::string transport;
        read(j, "", "transport", transport);
        if (transport == "stdio") {
            config.transport = ServerConfig::Transport::Stdio;
        } else if (transport == "http") {
            config.transport = ServerConfig::Transport::Http;
        } else {
            throw ConfigError("Unknown transport: " + transport);
        }
    }

    if (j.contains("log_level")) {
        std::string level;
        read(j, "", "log_level", level);
        try {
            config.log_level = log_level_from_string(level);
        } catch (const std::invalid_argument&) {
            throw ConfigError("Unknown log level: " + level);
        }
    }

    if (const auto* s = section(j, "server")) {
        reject_unknown(*s, "server.", {"name", "version", "instructions", "page_size",
                                       "builtin_tools"});
        read(*s, "server.", "name", config.server.server_info.name);
        read(*s, "server.", "version", config.server.server_info.version);
        if (s->contains("instructions")) {
            std::string instructions;
            read(*s, "server.", "instructions", instructions);
            config.server.instructions = instructions;
        }
        read_count(*s, "server.", "page_size", config.server.page_size);
        read(*s, "server.", "builtin_tools", config.server.builtin_tools);
        if (config.server.page_size == 0) {
            throw ConfigError("server.page_size must be positive");
        }
    }

    if (const auto* d = section(j, "dispatch")) {
        reject_unknown(*d, "dispatch.", {"invocation_timeout_ms", "admission_wait_ms",
                                          "max_in_flight", "max_unfinished_per_tool"});
        if (d->contains("invocation_timeout_ms")) {
            size_t ms = 0;
            read_count(*d, "dispatch.", "invocation_timeout_ms", ms);
            if (ms == 0) throw ConfigError("dispatch.invocation_timeout_ms must be positive");
            config.server.dispatch.invocation_timeout = std::chrono::milliseconds(ms);
        }
        if (d->contains("admission_wait_ms")) {
            size_t ms = 0;
            read_count(*d, "dispatch.", "admission_wait_ms", ms);
            config.server.dispatch.admission_wait = std::chrono::milliseconds(ms);
        }
        read_count(*d, "dispatch.", "max_in_flight", config.server.dispatch.max_in_flight);
        if (config.server.dispatch.max_in_flight == 0) {
            throw ConfigError("dispatch.max_in_flight must be positive");
        }
        read_count(*d, "dispatch.", "max_unfinished_per_tool",
                   config.server.dispatch.max_unfinished_per_tool);
        if (config.server.dispatch.max_unfinished_per_tool == 0) {
            throw ConfigError("dispatch.max_unfinished_per_tool must be positive");
        }
    }

    if (const auto* s = section(j, "stdio")) {
        reject_unknown(*s, "stdio.", {"max_frame_bytes", "pipeline_depth"});
        read_count(*s, "stdio.", "max_frame_bytes", config.stdio.max_frame_bytes);
        read_count(*s, "stdio.", "pipeline_depth", config.stdio.pipeline_depth);
        if (config.stdio.pipeline_depth == 0) {
            throw ConfigError("stdio.pipeline_depth must be positive");
        }
    }

    if (const auto* h = section(j, "http")) {
        reject_unknown(*h, "http.", {"host", "port", "mcp_path", "allowed_origins",
                                     "max_connections", "max_body_bytes", "allow_sessionless"});
        read(*h, "http.", "host", config.http.host);
        if (h->contains("port")) {
            size_t port = 0;
            read_count(*h, "http.", "port", port);
            if (port > 65535) throw ConfigError("http.port out of range");
            config.http.port = static_cast<uint16_t>(port);
        }
        read(*h, "http.", "mcp_path", config.http.mcp_path);
        read(*h, "http.", "allowed_origins", config.http.allowed_origins);
        read_count(*h, "http.", "max_connections", config.http.max_connections);
        if (config.http.max_connections == 0) {
            throw ConfigError("http.max_connections must be positive");
        }
        read_count(*h, "http.", "max_body_bytes", config.http.max_body_bytes);
        read(*h, "http.", "allow_sessionless", config.http.allow_sessionless);
        if (config.http.mcp_path.empty() || config.http.mcp_path.front() != '/') {
            throw ConfigError("http.mcp_path must start with '/'");
        }
    }
}

ServerConfig parse_config(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Config is not valid JSON: ") + e.what());
    }
    ServerConfig config;
    from_json(j, config);
    return config;
}

ServerConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str());
}

} // namespace vlive
