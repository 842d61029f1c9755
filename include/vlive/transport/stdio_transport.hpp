#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include "../session.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace vlive {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// One Session per transport. Requests are served by `pipeline_depth` workers;
/// with the default of 1, each response is written before the next request is
/// started. Notifications are handled on the reader thread so a cancellation
/// overtakes the request it targets.
///
/// EOF on input ends reading only: requests already received are still
/// answered before start() returns. shutdown() or a failed write cancels
/// in-flight handlers and drops queued requests.
class StdioTransport : public ITransport {
public:
    struct Options {
        size_t max_frame_bytes = 4 * 1024 * 1024;
        size_t pipeline_depth = 1;
    };

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership of both descriptors.
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    void start(Router& router, ErrorCallback on_error = nullptr) override;
    void shutdown() override;
    bool is_connected() const override;

    [[nodiscard]] Session& session() { return session_; }
    [[nodiscard]] const Options& options() const { return opts_; }

private:
    /// True when input reached EOF, false on shutdown or a read failure.
    bool read_loop();
    void write_loop();
    void worker_loop();

    void handle_frame(std::string line);
    void reject_oversized(size_t size);
    void enqueue_write(std::string data);
    void report(std::exception_ptr e);
    void wake_reader();
    void abort_pending();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    Options opts_;

    Session session_;
    Router* router_{nullptr};
    ErrorCallback on_error_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;
    std::vector<std::thread> workers_;

    std::mutex inbound_mutex_;
    std::condition_variable inbound_cv_;
    std::deque<JsonRpcMessage> inbound_;
    bool inbound_closed_{false};

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;
    bool writer_stop_{false};

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in read_loop
};

} // namespace vlive
