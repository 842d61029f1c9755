#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "session.hpp"
#include "dispatcher.hpp"
#include "version.hpp"
#include "log.hpp"
#include <memory>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace vlive {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using MethodHandler = std::function<HandlerResult(Session& session, const JsonRpcRequest& req)>;
using NotificationHandler = std::function<void(Session& session, const nlohmann::json& params)>;

/// JSON-RPC method table shared by every transport. Decodes an inbound
/// message, routes it by method and encodes the outcome as a response.
class Router {
public:
    struct Options {
        Implementation server_info{"vienna-live-mcp", std::nullopt, std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        size_t page_size = 50;
        std::shared_ptr<Logger> logger;
    };

    /// Installs initialize, ping, tools/list, tools/call and the
    /// initialized / cancelled notifications.
    Router(Dispatcher& dispatcher, Options opts);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    void on_request(const std::string& method, MethodHandler handler);
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Returns the response to send, or nullopt for notifications and
    /// inbound responses. Never throws for a well-formed message.
    [[nodiscard]] std::optional<JsonRpcResponse> handle(Session& session,
                                                        const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

    [[nodiscard]] Dispatcher& dispatcher() { return dispatcher_; }
    [[nodiscard]] const Options& options() const { return opts_; }

private:
    void install_builtin_methods();

    HandlerResult on_initialize(Session& session, const JsonRpcRequest& req);
    HandlerResult on_tools_list(Session& session, const JsonRpcRequest& req);
    HandlerResult on_tools_call(Session& session, const JsonRpcRequest& req);

    Dispatcher& dispatcher_;
    Options opts_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MethodHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace vlive
