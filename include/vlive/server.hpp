#pragma once
#include "types.hpp"
#include "registry.hpp"
#include "dispatcher.hpp"
#include "log.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace vlive {

class Router;

/// Owns the tool registry, seals it when serving starts and runs one
/// transport adapter at a time.
class Server {
public:
    struct Options {
        Implementation server_info{"vienna-live-mcp", std::nullopt, std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        Dispatcher::Options dispatch;
        size_t page_size = 50;
        /// Register get_server_status and get_portmanteau_info.
        bool builtin_tools = true;
        /// Defaults to a StderrSink logger at Info.
        std::shared_ptr<Logger> logger;
    };

    explicit Server(Options opts);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Throws DuplicateToolError, SchemaError, or RegistrySealedError once serving began.
    const ToolDescriptor& add_tool(ToolDescriptor descriptor);

    [[nodiscard]] const ToolRegistry& registry() const;
    [[nodiscard]] Logger& logger();

    // ---- Transport ----
    void serve_stdio();
    void serve_stdio(StdioTransport::Options opts);
    void serve_http(HttpServerTransport::Options opts);

    /// Blocks until the transport stops.
    void serve(std::unique_ptr<ITransport> transport);
    void shutdown();

    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vlive
