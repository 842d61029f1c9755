#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include "../session.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace vlive {

/// HTTP server transport: one JSON-RPC message per POST, answered in the
/// response body. Sessions are created by `initialize` and addressed with the
/// Mcp-Session-Id header; requests without one run in a throwaway session.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;  // 0 picks a free port, see port()
        std::string mcp_path = "/mcp";
        std::vector<std::string> allowed_origins;
        size_t max_connections = 64;
        size_t max_body_bytes = 4 * 1024 * 1024;
        /// Implicitly handshake requests that carry no session id.
        bool allow_sessionless = true;
        /// How often a running tools/call checks whether its client hung up.
        std::chrono::milliseconds disconnect_poll_interval{100};
    };

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    void start(Router& router, ErrorCallback on_error = nullptr) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Port actually bound. Meaningful once wait_until_bound() returned true.
    [[nodiscard]] uint16_t port() const;

    /// Block until the listening socket is bound or `timeout` elapses.
    bool wait_until_bound(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t session_count() const;

private:
    bool validate_origin(const std::string& origin) const;
    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);
    std::shared_ptr<Session> find_session(const std::string& id) const;
    void report(std::exception_ptr e);

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    Router* router_{nullptr};
    ErrorCallback error_callback_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};

    mutable std::mutex bind_mutex_;
    std::condition_variable bind_cv_;
    bool bound_{false};
    uint16_t bound_port_{0};

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace vlive
