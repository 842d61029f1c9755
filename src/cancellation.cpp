#include "vlive/cancellation.hpp"
#include <thread>
#include <vector>

namespace vlive {

// ---------- CancellationRegistration ----------

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& o) noexcept
    : state_(std::move(o.state_)), id_(o.id_) {
    o.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& o) noexcept {
    if (this != &o) {
        reset();
        state_ = std::move(o.state_);
        id_ = o.id_;
        o.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (id_ == 0) return;
    if (auto s = state_.lock()) {
        std::lock_guard<std::mutex> lock(s->mutex);
        s->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

// ---------- CancellationToken ----------

bool CancellationToken::is_cancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds d) const {
    if (!state_) {
        std::this_thread::sleep_for(d);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, d, [this] { return state_->cancelled; });
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> fn) const {
    if (!state_) return {};
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            uint64_t id = state_->next_callback_id++;
            state_->callbacks.emplace(id, std::move(fn));
            return CancellationRegistration(state_, id);
        }
    }
    fn();
    return {};
}

// ---------- CancellationSource ----------

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

void CancellationSource::cancel() {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        for (auto& [id, fn] : state_->callbacks) to_run.push_back(std::move(fn));
        state_->callbacks.clear();
    }
    state_->cv.notify_all();
    // Run outside the lock so callbacks may cancel other sources.
    for (auto& fn : to_run) fn();
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

} // namespace vlive
