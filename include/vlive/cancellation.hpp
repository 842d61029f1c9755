#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace vlive {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    uint64_t next_callback_id{1};
    std::map<uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

/// RAII handle for a callback registered on a token. Unregisters on destruction.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& o) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& o) noexcept;

    void reset();

private:
    std::weak_ptr<detail::CancellationState> state_;
    uint64_t id_{0};
};

/// Read side of a cancellation signal, handed to tool handlers.
/// Cancellation is cooperative: handlers poll is_cancelled() or wait on the token.
class CancellationToken {
public:
    /// A token that is never cancelled.
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const;

    /// Sleep for up to `d`, waking early on cancellation. Returns true if cancelled.
    bool wait_for(std::chrono::milliseconds d) const;

    /// Run `fn` once when cancelled (immediately if already cancelled).
    /// `fn` must not block; it may run on the cancelling thread.
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> fn) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> s)
        : state_(std::move(s)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    [[nodiscard]] CancellationToken token() const;

    /// Idempotent. Fires registered callbacks exactly once.
    void cancel();

    [[nodiscard]] bool is_cancelled() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace vlive
