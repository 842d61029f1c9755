#include "vlive/worker_pool.hpp"
#include <system_error>
#include <vector>

namespace vlive {

WorkerPool::WorkerPool(size_t workers) : state_(std::make_shared<State>()) {
    if (workers == 0) workers = 1;
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (size_t i = 0; i < workers; ++i) {
        spawn_locked();
    }
}

WorkerPool::~WorkerPool() {
    std::vector<std::thread> to_join;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        for (auto& entry : state_->threads) {
            if (state_->stuck.count(entry.first) > 0) {
                entry.second.detach();
            } else {
                to_join.push_back(std::move(entry.second));
            }
        }
        state_->threads.clear();
    }
    state_->cv.notify_all();
    for (auto& t : to_join) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->tasks.push_back(std::move(task));
    }
    state_->cv.notify_one();
}

bool WorkerPool::mark_stuck(std::thread::id worker) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->stopping || state_->threads.count(worker) == 0) return true;
    if (!state_->stuck.insert(worker).second) return true;
    try {
        spawn_locked();
    } catch (const std::system_error&) {
        return false;
    }
    return true;
}

size_t WorkerPool::size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->threads.size();
}

size_t WorkerPool::stuck() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->stuck.size();
}

void WorkerPool::spawn_locked() {
    // The new thread blocks on the mutex held by the caller until it is registered
    std::thread t(&WorkerPool::run, state_);
    auto id = t.get_id();
    state_->threads.emplace(id, std::move(t));
}

void WorkerPool::run(const std::shared_ptr<State>& state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        state->cv.wait(lock, [&] { return state->stopping || !state->tasks.empty(); });
        if (state->tasks.empty()) return;

        auto task = std::move(state->tasks.front());
        state->tasks.pop_front();
        lock.unlock();
        task();
        lock.lock();

        auto self = std::this_thread::get_id();
        if (state->stuck.erase(self) > 0) {
            // A replacement already took this worker's place
            auto it = state->threads.find(self);
            if (it != state->threads.end()) {
                it->second.detach();
                state->threads.erase(it);
            }
            return;
        }
    }
}

} // namespace vlive
