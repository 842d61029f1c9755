#include "vlive/dispatcher.hpp"
#include "vlive/error.hpp"
#include "vlive/schema.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace vlive {

// ---------- AdmissionGate ----------

bool AdmissionGate::try_acquire_for(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, wait, [this] { return in_use_ < limit_; })) {
        return false;
    }
    ++in_use_;
    return true;
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_one();
}

size_t AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

// ---------- Dispatcher ----------

namespace {

/// Shared between the waiting dispatcher and the worker running the handler.
struct Invocation {
    std::mutex mutex;
    std::condition_variable cv;
    bool running{false};
    bool done{false};
    bool abandoned{false};   // the dispatcher stopped waiting
    bool unfinished{false};  // abandoned while the handler was running
    std::thread::id worker;
    nlohmann::json payload;
    std::exception_ptr fault;
    std::atomic<bool> holds_slot{true};
};

void release_slot(Invocation& inv, AdmissionGate& gate) {
    if (inv.holds_slot.exchange(false)) gate.release();
}

Result make_failure(const RequestId& id, int code, std::string message,
                    std::optional<nlohmann::json> details = std::nullopt) {
    return Result{id, Failure{code, std::move(message), std::move(details)}};
}

Result from_fault(const RequestId& id, std::exception_ptr fault) {
    try {
        std::rethrow_exception(fault);
    } catch (const ProtocolError& e) {
        return make_failure(id, e.code, e.what(), e.details);
    } catch (const std::exception& e) {
        return make_failure(id, error::HandlerError, e.what());
    } catch (...) {
        return make_failure(id, error::HandlerError, "Handler raised a non-standard exception");
    }
}

/// Ends the session's in-flight tracking on every exit path.
class InFlightGuard {
public:
    InFlightGuard(Session& s, const RequestId& id) : session_(s), id_(id) {}
    ~InFlightGuard() { session_.end_request(id_); }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    Session& session_;
    const RequestId& id_;
};

} // anonymous namespace

class Dispatcher::UnfinishedCounts {
public:
    size_t count(std::string_view tool) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(std::string(tool));
        return it == counts_.end() ? 0 : it->second;
    }

    void add(const std::string& tool) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[tool];
    }

    void remove(const std::string& tool) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(tool);
        if (it == counts_.end()) return;
        if (--it->second == 0) counts_.erase(it);
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

Dispatcher::Dispatcher(std::shared_ptr<const ToolRegistry> registry, Options opts)
    : registry_(std::move(registry))
    , opts_(std::move(opts))
    , gate_(std::make_shared<AdmissionGate>(opts_.max_in_flight))
    , unfinished_(std::make_shared<UnfinishedCounts>()) {
    if (!registry_) {
        throw std::invalid_argument("Dispatcher requires a registry");
    }
    if (opts_.max_unfinished_per_tool == 0) opts_.max_unfinished_per_tool = 1;
    pool_ = std::make_unique<WorkerPool>(gate_->limit());
}

size_t Dispatcher::unfinished(std::string_view tool) const {
    return unfinished_->count(tool);
}

Result Dispatcher::dispatch(Session& session, const Request& request) {
    auto started = std::chrono::steady_clock::now();
    const ToolDescriptor* tool = nullptr;

    Result result = [&]() -> Result {
        auto state = session.state();
        if (state != SessionState::Ready) {
            return make_failure(request.id, error::ProtocolState,
                                state == SessionState::Closed ? "Session is closed"
                                                              : "Session is not initialized",
                                nlohmann::json{{"state", std::string(session_state_to_string(state))}});
        }

        tool = registry_->find(request.tool_name);
        if (!tool) {
            UnknownToolError e(request.tool_name);
            return make_failure(request.id, e.code, e.what(), e.details);
        }

        nlohmann::json args;
        try {
            args = SchemaValidator::validate(tool->input_schema, request.arguments);
        } catch (const ArgumentError& e) {
            return make_failure(request.id, e.code, e.what(), e.details);
        }

        return invoke(session, *tool, request, std::move(args));
    }();

    record(session, request, tool, result, std::chrono::steady_clock::now() - started);
    return result;
}

Result Dispatcher::invoke(Session& session, const ToolDescriptor& tool, const Request& request,
                          nlohmann::json arguments) {
    CancellationSource source = session.begin_request(request.id);
    InFlightGuard guard(session, request.id);
    CancellationToken token = source.token();

    size_t stuck = unfinished_->count(tool.name);
    if (stuck >= opts_.max_unfinished_per_tool) {
        return make_failure(request.id, error::ServerBusy,
                            "Tool '" + tool.name + "' has too many unfinished invocations",
                            nlohmann::json{{"tool", tool.name}, {"unfinished", stuck}});
    }

    auto deadline = std::chrono::steady_clock::now() + opts_.invocation_timeout;

    // Waiting for a slot counts against the invocation budget
    if (!gate_->try_acquire_for(std::min(opts_.admission_wait, opts_.invocation_timeout))) {
        return make_failure(request.id, error::ServerBusy,
                            "Too many concurrent tool invocations",
                            nlohmann::json{{"max_in_flight", gate_->limit()}});
    }

    auto inv = std::make_shared<Invocation>();
    pool_->submit([inv, gate = gate_, unfinished = unfinished_, registry = registry_,
                   handler = &tool.handler, name = tool.name, args = std::move(arguments),
                   token]() {
        {
            std::lock_guard<std::mutex> lock(inv->mutex);
            // Given up on before a worker picked it up
            if (inv->abandoned) return;
            inv->running = true;
            inv->worker = std::this_thread::get_id();
        }
        nlohmann::json payload;
        std::exception_ptr fault;
        try {
            payload = (*handler)(args, token);
        } catch (...) {
            fault = std::current_exception();
        }
        release_slot(*inv, *gate);
        bool was_unfinished;
        {
            std::lock_guard<std::mutex> lock(inv->mutex);
            inv->payload = std::move(payload);
            inv->fault = fault;
            inv->running = false;
            inv->done = true;
            was_unfinished = inv->unfinished;
        }
        inv->cv.notify_all();
        if (was_unfinished) unfinished->remove(name);
    });

    // Wake the waiter on cancellation (explicit cancel or session close)
    auto registration = token.on_cancel([inv] {
        std::lock_guard<std::mutex> lock(inv->mutex);
        inv->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(inv->mutex);
    inv->cv.wait_until(lock, deadline, [&] { return inv->done || token.is_cancelled(); });

    if (inv->done && !token.is_cancelled()) {
        if (inv->fault) return from_fault(request.id, inv->fault);
        return Result{request.id, Success{std::move(inv->payload)}};
    }

    // Stop waiting. A handler still running keeps its worker, which is replaced.
    inv->abandoned = true;
    bool replaced = true;
    if (inv->running) {
        inv->unfinished = true;
        unfinished_->add(tool.name);
        replaced = pool_->mark_stuck(inv->worker);
    }
    lock.unlock();
    release_slot(*inv, *gate_);

    if (!replaced && opts_.logger) {
        opts_.logger->warning("worker_pool", {{"event", "replacement_failed"},
                                              {"tool", tool.name}});
    }

    // A cancelled request reports Cancelled even if its handler also finished
    if (token.is_cancelled()) {
        bool closed = session.state() == SessionState::Closed;
        return make_failure(request.id, error::Cancelled,
                            closed ? "Session closed" : "Request cancelled");
    }

    source.cancel();
    return make_failure(request.id, error::HandlerTimeout,
                        "Tool '" + tool.name + "' timed out",
                        nlohmann::json{{"timeout_ms", opts_.invocation_timeout.count()}});
}

void Dispatcher::record(const Session& session, const Request& request,
                        const ToolDescriptor* tool, const Result& result,
                        std::chrono::steady_clock::duration elapsed) {
    if (!opts_.logger) return;
    LogLevel level = result.ok() ? LogLevel::Info : LogLevel::Warning;
    if (!opts_.logger->enabled(level)) return;

    double ms = std::chrono::duration<double, std::milli>(elapsed).count();
    nlohmann::json data = {
        {"session", session.id()},
        {"request_id", to_string(request.id)},
        {"tool", request.tool_name},
        {"category", tool ? nlohmann::json(tool->category) : nlohmann::json(nullptr)},
        {"duration_ms", ms},
        {"outcome", result.ok() ? "ok" : error::code_name(result.failure().code)}
    };
    opts_.logger->log(level, "dispatch", data);
}

} // namespace vlive
