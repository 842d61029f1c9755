#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace vlive {

/// Fixed-size pool of handler threads.
///
/// A worker whose task its caller stopped waiting for can be marked stuck.
/// The pool starts a replacement at once so capacity stays constant, and the
/// stuck worker retires when its task finally returns. On destruction idle
/// and busy workers are joined; stuck workers are detached and keep the
/// pool's shared state alive until they exit.
class WorkerPool {
public:
    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Tasks must not throw.
    void submit(std::function<void()> task);

    /// Replace the worker `worker`, whose current task will not be waited for.
    /// False if the replacement thread could not be started.
    bool mark_stuck(std::thread::id worker);

    /// Threads currently owned by the pool, stuck ones included.
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t stuck() const;

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::function<void()>> tasks;
        std::unordered_map<std::thread::id, std::thread> threads;
        std::unordered_set<std::thread::id> stuck;
        bool stopping{false};
    };

    static void run(const std::shared_ptr<State>& state);
    void spawn_locked();

    std::shared_ptr<State> state_;
};

} // namespace vlive
