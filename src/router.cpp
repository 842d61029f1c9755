#include "vlive/router.hpp"
#include "vlive/codec.hpp"
#include "vlive/error.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace vlive {

namespace {

JsonRpcError to_rpc_error(const ProtocolError& e) {
    return JsonRpcError{e.code, e.what(), e.details};
}

JsonRpcError state_error(SessionState state) {
    return JsonRpcError{
        error::ProtocolState,
        state == SessionState::Closed ? "Session is closed" : "Session is not initialized",
        nlohmann::json{{"state", std::string(session_state_to_string(state))}}
    };
}

nlohmann::json params_of(const JsonRpcRequest& req) {
    return req.params ? *req.params : nlohmann::json::object();
}

// Cursors are plain decimal offsets no larger than the listing itself
std::optional<size_t> parse_cursor(const std::string& text, size_t limit) {
    if (text.empty()) return std::nullopt;
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<size_t>(c - '0');
        if (value > limit) return std::nullopt;
    }
    return value;
}

} // anonymous namespace

Router::Router(Dispatcher& dispatcher, Options opts)
    : dispatcher_(dispatcher), opts_(std::move(opts)) {
    if (opts_.page_size == 0) opts_.page_size = 1;
    install_builtin_methods();
}

void Router::on_request(const std::string& method, MethodHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

void Router::install_builtin_methods() {
    on_request("initialize", [this](Session& s, const JsonRpcRequest& r) {
        return on_initialize(s, r);
    });

    on_request("ping", [](Session&, const JsonRpcRequest&) -> HandlerResult {
        return nlohmann::json::object();
    });

    on_request("tools/list", [this](Session& s, const JsonRpcRequest& r) {
        return on_tools_list(s, r);
    });

    on_request("tools/call", [this](Session& s, const JsonRpcRequest& r) {
        return on_tools_call(s, r);
    });

    // The handshake already moved the session to Ready
    on_notification("notifications/initialized", [](Session&, const nlohmann::json&) {});

    on_notification("notifications/cancelled", [](Session& s, const nlohmann::json& params) {
        auto it = params.find("requestId");
        if (it == params.end()) return;
        RequestId id;
        from_json(*it, id);
        s.cancel_request(id);
    });
}

HandlerResult Router::on_initialize(Session& session, const JsonRpcRequest& req) {
    HandshakeRequest hs;
    try {
        from_json(params_of(req), hs);
    } catch (const nlohmann::json::exception& e) {
        return JsonRpcError{error::InvalidParams,
                            std::string("Invalid initialize params: ") + e.what(),
                            std::nullopt};
    }

    HandshakeResult result;
    result.protocol_version = session.handshake(hs);
    result.capabilities.tools = nlohmann::json{{"listChanged", false}};
    result.server_info = opts_.server_info;
    result.instructions = opts_.instructions;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Router::on_tools_list(Session& session, const JsonRpcRequest& req) {
    auto state = session.state();
    if (state != SessionState::Ready) return state_error(state);

    auto params = params_of(req);
    const auto& registry = dispatcher_.registry();
    size_t start = 0;
    auto cursor = params.find("cursor");
    if (cursor != params.end() && !cursor->is_null()) {
        if (!cursor->is_string()) {
            return JsonRpcError{error::InvalidParams, "cursor must be a string", std::nullopt};
        }
        auto parsed = parse_cursor(cursor->get<std::string>(), registry.size());
        if (!parsed) {
            return JsonRpcError{error::InvalidParams, "Invalid cursor",
                                nlohmann::json{{"cursor", *cursor}}};
        }
        start = *parsed;
    }

    size_t end = start + std::min(opts_.page_size, registry.size() - start);
    nlohmann::json tools = nlohmann::json::array();
    size_t index = 0;
    for (const auto& tool : registry.list_by_category()) {
        if (index >= end) break;
        if (index >= start) tools.push_back(tool);
        ++index;
    }

    nlohmann::json result = {{"tools", std::move(tools)}};
    if (end < registry.size()) result["nextCursor"] = std::to_string(end);
    return result;
}

HandlerResult Router::on_tools_call(Session& session, const JsonRpcRequest& req) {
    // An unready session is refused before its params are looked at
    auto state = session.state();
    if (state != SessionState::Ready) return state_error(state);

    Request request = Codec::to_request(req);
    Result result = dispatcher_.dispatch(session, request);
    JsonRpcResponse resp = Codec::to_response(result);
    if (resp.error) return *resp.error;
    return std::move(*resp.result);
}

std::optional<JsonRpcResponse> Router::handle(Session& session, const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        JsonRpcResponse resp;
        resp.id = req->id;

        auto state = session.state();
        if (state == SessionState::Closed) {
            resp.error = state_error(state);
            return resp;
        }

        MethodHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it == request_handlers_.end()) {
                resp.error = JsonRpcError{error::MethodNotFound,
                                          "Method not found: " + req->method,
                                          std::nullopt};
                return resp;
            }
            handler = it->second;
        }
        // Called without the lock held; handlers may block for the whole invocation
        try {
            auto result = handler(session, *req);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                resp.result = std::move(*ok);
            } else {
                resp.error = std::get<JsonRpcError>(std::move(result));
            }
        } catch (const ProtocolError& e) {
            resp.error = to_rpc_error(e);
        } catch (const std::exception& e) {
            resp.error = JsonRpcError{error::InternalError, e.what(), std::nullopt};
        }
        return resp;
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it == notification_handlers_.end()) return std::nullopt;
            handler = it->second;
        }
        try {
            handler(session, notif->params ? *notif->params : nlohmann::json::object());
        } catch (const std::exception& e) {
            // Notifications carry no id, so there is nobody to answer
            if (opts_.logger) {
                opts_.logger->warning("router", {{"session", session.id()},
                                                 {"method", notif->method},
                                                 {"error", e.what()}});
            }
        }
        return std::nullopt;
    }

    // Inbound responses: this server issues no requests of its own
    return std::nullopt;
}

} // namespace vlive
