#pragma once
#include "types.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "log.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string_view>

namespace vlive {

/// Counting semaphore bounding concurrent handler invocations.
class AdmissionGate {
public:
    explicit AdmissionGate(size_t limit) : limit_(limit == 0 ? 1 : limit) {}

    /// Take a slot, waiting up to `wait`. False if none freed up in time.
    bool try_acquire_for(std::chrono::milliseconds wait);
    void release();

    [[nodiscard]] size_t in_use() const;
    [[nodiscard]] size_t limit() const { return limit_; }

private:
    const size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_use_{0};
};

/// Transport-agnostic dispatch: session gate -> resolve -> validate -> invoke.
///
/// Every call returns exactly one Result carrying the request id; no fault
/// raised by resolution, validation or a handler escapes. Handlers run on a
/// worker pool under `invocation_timeout`. On timeout, cancellation or session
/// close the dispatcher returns immediately, signals the handler's token and
/// gives the admission slot back. A handler still running after that is
/// "unfinished": its worker is replaced, and a tool with
/// `max_unfinished_per_tool` of them is refused with ServerBusy until some return.
class Dispatcher {
public:
    struct Options {
        std::chrono::milliseconds invocation_timeout{30000};
        /// How long a call waits for an admission slot before ServerBusy.
        /// Capped at `invocation_timeout`.
        std::chrono::milliseconds admission_wait{1000};
        size_t max_in_flight = 64;
        size_t max_unfinished_per_tool = 4;
        std::shared_ptr<Logger> logger;
    };

    Dispatcher(std::shared_ptr<const ToolRegistry> registry, Options opts);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    [[nodiscard]] Result dispatch(Session& session, const Request& request);

    [[nodiscard]] const ToolRegistry& registry() const { return *registry_; }
    [[nodiscard]] const Options& options() const { return opts_; }

    /// Handler invocations currently holding an admission slot.
    [[nodiscard]] size_t in_flight() const { return gate_->in_use(); }

    /// Handlers of `tool` that were given up on and have not returned yet.
    [[nodiscard]] size_t unfinished(std::string_view tool) const;

private:
    class UnfinishedCounts;

    Result invoke(Session& session, const ToolDescriptor& tool, const Request& request,
                  nlohmann::json arguments);
    void record(const Session& session, const Request& request, const ToolDescriptor* tool,
                const Result& result, std::chrono::steady_clock::duration elapsed);

    std::shared_ptr<const ToolRegistry> registry_;
    Options opts_;
    std::shared_ptr<AdmissionGate> gate_;
    std::shared_ptr<UnfinishedCounts> unfinished_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace vlive
