#include "vlive/transport/http_transport.hpp"
#include "vlive/router.hpp"
#include "vlive/error.hpp"
#include "vlive/version.hpp"

#include <httplib.h>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace vlive {

namespace {

constexpr const char* kJson = "application/json";

void set_error(httplib::Response& res, int status, int code, const std::string& message,
               std::optional<nlohmann::json> data = std::nullopt) {
    res.status = status;
    res.set_content(make_unidentified_error(code, message, std::move(data)).dump(), kJson);
}

/// Polls a client connection while its request runs and fires `on_close`
/// once if the client goes away.
class DisconnectWatch {
public:
    DisconnectWatch(std::function<bool()> is_closed, std::function<void()> on_close,
                    std::chrono::milliseconds interval)
        : is_closed_(std::move(is_closed)), on_close_(std::move(on_close)) {
        thread_ = std::thread([this, interval] {
            std::unique_lock<std::mutex> lock(mutex_);
            while (!cv_.wait_for(lock, interval, [this] { return done_; })) {
                if (is_closed_()) {
                    fired_ = true;
                    lock.unlock();
                    on_close_();
                    return;
                }
            }
        });
    }

    ~DisconnectWatch() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    DisconnectWatch(const DisconnectWatch&) = delete;
    DisconnectWatch& operator=(const DisconnectWatch&) = delete;

    /// Valid once the watch is destroyed or stopped; read after the request finished.
    bool fired() {
        std::lock_guard<std::mutex> lock(mutex_);
        return fired_;
    }

private:
    std::function<bool()> is_closed_;
    std::function<void()> on_close_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_{false};
    bool fired_{false};
    std::thread thread_;
};

} // anonymous namespace

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    for (const auto& allowed : opts_.allowed_origins) {
        if (origin == allowed) return true;
    }
    return false;
}

std::shared_ptr<Session> HttpServerTransport::find_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t HttpServerTransport::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void HttpServerTransport::report(std::exception_ptr e) {
    if (error_callback_) error_callback_(e);
}

void HttpServerTransport::setup_routes() {
    const std::string path = opts_.mcp_path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });

    // No server-initiated stream
    server_->Get(path, [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "POST, DELETE");
    });

    server_->Delete(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete(req, res);
    });

    // Bodies rejected by httplib itself (e.g. over the payload limit) get a JSON-RPC error
    server_->set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        if (res.status == 413) {
            res.set_content(make_unidentified_error(
                                error::PayloadTooLarge,
                                "Request body exceeds limit of "
                                    + std::to_string(opts_.max_body_bytes) + " bytes",
                                nlohmann::json{{"limit", opts_.max_body_bytes}})
                                .dump(),
                            kJson);
        }
    });
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    // Validate Origin header for DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        set_error(res, 403, error::InvalidRequest, "Origin not allowed: " + origin);
        return;
    }

    if (req.body.size() > opts_.max_body_bytes) {
        PayloadTooLargeError err(req.body.size(), opts_.max_body_bytes);
        set_error(res, 413, err.code, err.what(), err.details);
        report(std::make_exception_ptr(err));
        return;
    }

    auto proto_ver = req.get_header_value("MCP-Protocol-Version");
    if (!proto_ver.empty() && !is_supported_protocol_version(proto_ver)) {
        set_error(res, 400, error::InvalidRequest, "Unsupported protocol version: " + proto_ver);
        return;
    }

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(req.body);
    } catch (const FramingError& e) {
        set_error(res, 400, error::ParseError, e.what());
        report(std::current_exception());
        return;
    }

    if (std::holds_alternative<JsonRpcResponse>(msg)) {
        res.status = 202;
        return;
    }

    const auto* rpc_req = std::get_if<JsonRpcRequest>(&msg);
    std::string session_id = req.get_header_value("Mcp-Session-Id");
    std::shared_ptr<Session> session;
    bool persistent = false;

    if (!session_id.empty()) {
        session = find_session(session_id);
        if (!session) {
            res.status = 404;
            JsonRpcResponse resp;
            JsonRpcError err{error::ProtocolState, "Session not found",
                             nlohmann::json{{"session", session_id}}};
            if (rpc_req) {
                resp.id = rpc_req->id;
                resp.error = std::move(err);
                res.set_content(Codec::serialize(resp), kJson);
            } else {
                res.set_content(make_unidentified_error(err.code, err.message, err.data).dump(),
                                kJson);
            }
            return;
        }
        persistent = true;
    } else if (rpc_req && rpc_req->method == "initialize") {
        session = std::make_shared<Session>();
        persistent = true;
    } else {
        // Throwaway session for a single sessionless request
        session = std::make_shared<Session>();
        if (opts_.allow_sessionless) {
            session->assume_ready(std::string(PROTOCOL_VERSION));
        }
    }

    // A client that hangs up mid-call cancels that call
    std::unique_ptr<DisconnectWatch> watch;
    if (rpc_req && rpc_req->method == "tools/call" && req.is_connection_closed) {
        RequestId id = rpc_req->id;
        watch = std::make_unique<DisconnectWatch>(
            req.is_connection_closed,
            [session, persistent, id] {
                if (persistent) {
                    session->cancel_request(id);
                } else {
                    session->close();
                }
            },
            opts_.disconnect_poll_interval);
    }

    std::optional<JsonRpcResponse> resp;
    try {
        resp = router_->handle(*session, msg);
    } catch (const std::exception& e) {
        watch.reset();
        report(std::current_exception());
        set_error(res, 500, error::InternalError, e.what());
        if (!persistent) session->close();
        return;
    }
    bool client_gone = false;
    if (watch) {
        client_gone = watch->fired();
        watch.reset();
    }

    if (!persistent) {
        session->close();
    } else if (session_id.empty()) {
        // New session from initialize: keep it only if the handshake succeeded
        if (resp && !resp->error) {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_[session->id()] = session;
        }
        if (session->state() == SessionState::Ready) {
            res.set_header("Mcp-Session-Id", session->id());
        }
    }

    if (!resp) {
        res.status = 202;
        return;
    }
    if (client_gone) {
        // Nobody is left to read the answer
        res.status = 499;
        return;
    }
    res.status = 200;
    res.set_content(Codec::serialize(*resp), kJson);
}

void HttpServerTransport::handle_delete(const httplib::Request& req, httplib::Response& res) {
    std::string session_id = req.get_header_value("Mcp-Session-Id");
    if (session_id.empty()) {
        set_error(res, 400, error::InvalidRequest, "Missing Mcp-Session-Id header");
        return;
    }
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            res.status = 404;
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    // Cancels anything still running for this session
    session->close();
    res.status = 200;
}

void HttpServerTransport::start(Router& router, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    router_ = &router;
    error_callback_ = std::move(on_error);

    setup_routes();
    server_->set_payload_max_length(opts_.max_body_bytes);
    size_t pool_size = opts_.max_connections > 0 ? opts_.max_connections : 1;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    int port = -1;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
    } else if (server_->bind_to_port(opts_.host, opts_.port)) {
        port = opts_.port;
    }
    if (port <= 0) {
        running_ = false;
        throw TransportError("Failed to bind HTTP server on " + opts_.host + ":"
                             + std::to_string(opts_.port));
    }
    {
        std::lock_guard<std::mutex> lock(bind_mutex_);
        bound_ = true;
        bound_port_ = static_cast<uint16_t>(port);
    }
    bind_cv_.notify_all();

    // shutdown() may have raced the bind; stop() only takes effect on a bound socket
    if (!shutdown_requested_.load()) {
        server_->listen_after_bind();
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [id, session] : sessions_) {
            session->close();
        }
        sessions_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(bind_mutex_);
        bound_ = false;
    }
    running_ = false;
}

void HttpServerTransport::shutdown() {
    shutdown_requested_ = true;
    if (server_) server_->stop();
}

bool HttpServerTransport::is_connected() const {
    std::lock_guard<std::mutex> lock(bind_mutex_);
    return running_ && bound_;
}

uint16_t HttpServerTransport::port() const {
    std::lock_guard<std::mutex> lock(bind_mutex_);
    return bound_port_ != 0 ? bound_port_ : opts_.port;
}

bool HttpServerTransport::wait_until_bound(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(bind_mutex_);
    return bind_cv_.wait_for(lock, timeout, [this] { return bound_; });
}

} // namespace vlive
