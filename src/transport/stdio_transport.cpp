#include "vlive/transport/stdio_transport.hpp"
#include "vlive/router.hpp"
#include "vlive/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <cerrno>
#include <cstring>

namespace vlive {

StdioTransport::StdioTransport() : StdioTransport(Options{}) {}

StdioTransport::StdioTransport(Options opts)
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false), opts_(opts) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw TransportError("Failed to create wakeup pipe");
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : StdioTransport(opts) {
    read_fd_ = read_fd;
    write_fd_ = write_fd;
    owns_fds_ = true;
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(Router& router, ErrorCallback on_error) {
    // If shutdown() was called before start(), don't block.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    router_ = &router;
    on_error_ = std::move(on_error);
    connected_ = true;

    // A vanished reader must surface as EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    writer_thread_ = std::thread([this] { write_loop(); });
    size_t depth = opts_.pipeline_depth == 0 ? 1 : opts_.pipeline_depth;
    for (size_t i = 0; i < depth; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }

    bool at_eof = read_loop();

    {
        std::lock_guard<std::mutex> lock(inbound_mutex_);
        if (!at_eof) {
            // Shutdown or lost output: cancel what is running, drop what is queued
            session_.close();
            inbound_.clear();
        }
        inbound_closed_ = true;
    }
    inbound_cv_.notify_all();
    // At EOF the workers answer everything already queued before exiting
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    connected_ = false;
    session_.close();

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writer_stop_ = true;
    }
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();

    running_ = false;
}

bool StdioTransport::read_loop() {
    std::string buffer;
    buffer.reserve(4096);
    bool discarding = false;  // inside an oversized frame, skip to the next newline

    char chunk[4096];

    while (running_ && !shutdown_requested_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(std::make_exception_ptr(
                TransportError(std::string("poll failed: ") + std::strerror(errno))));
            break;
        }

        // Wakeup pipe has data: shutdown() was called
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            report(std::make_exception_ptr(
                TransportError(std::string("Read error: ") + std::strerror(errno))));
            break;
        }
        if (n == 0) {
            // A final line without a newline still counts
            if (!discarding && !buffer.empty()) handle_frame(std::move(buffer));
            return true;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        // Process complete lines
        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;

            if (discarding) {
                discarding = false;
                continue;
            }
            handle_frame(std::move(line));
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }

        if (discarding) {
            buffer.clear();
        } else if (buffer.size() > opts_.max_frame_bytes) {
            reject_oversized(buffer.size());
            buffer.clear();
            discarding = true;
        }
    }
    return false;
}

void StdioTransport::handle_frame(std::string line) {
    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty()) return;

    if (line.size() > opts_.max_frame_bytes) {
        reject_oversized(line.size());
        return;
    }

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const FramingError& e) {
        enqueue_write(make_unidentified_error(error::ParseError, e.what()).dump());
        report(std::current_exception());
        return;
    }

    if (std::holds_alternative<JsonRpcNotification>(msg)) {
        // Handled inline; a queued request may be the cancellation's target
        if (auto resp = router_->handle(session_, msg)) {
            enqueue_write(Codec::serialize(*resp));
        }
        return;
    }
    if (std::holds_alternative<JsonRpcResponse>(msg)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(inbound_mutex_);
        inbound_.push_back(std::move(msg));
    }
    inbound_cv_.notify_one();
}

void StdioTransport::reject_oversized(size_t size) {
    PayloadTooLargeError err(size, opts_.max_frame_bytes);
    enqueue_write(make_unidentified_error(err.code, err.what(), err.details).dump());
    report(std::make_exception_ptr(err));
}

void StdioTransport::worker_loop() {
    while (true) {
        JsonRpcMessage msg;
        {
            std::unique_lock<std::mutex> lock(inbound_mutex_);
            inbound_cv_.wait(lock, [this] { return !inbound_.empty() || inbound_closed_; });
            if (inbound_.empty()) return;
            msg = std::move(inbound_.front());
            inbound_.pop_front();
        }

        try {
            auto resp = router_->handle(session_, msg);
            // Nothing is written for a session that closed mid-invocation
            if (resp && session_.state() != SessionState::Closed) {
                enqueue_write(Codec::serialize(*resp));
            }
        } catch (const std::exception&) {
            report(std::current_exception());
        }
    }
}

void StdioTransport::enqueue_write(std::string data) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (writer_stop_) return;
        write_queue_.push(std::move(data));
    }
    write_cv_.notify_one();
}

void StdioTransport::write_loop() {
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || writer_stop_;
            });

            if (write_queue_.empty()) break;
            msg_to_write = std::move(write_queue_.front());
            write_queue_.pop();
        }

        msg_to_write += '\n';
        const char* data = msg_to_write.data();
        size_t remaining = msg_to_write.size();

        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                report(std::make_exception_ptr(
                    TransportError(std::string("Write error: ") + std::strerror(errno))));
                // Output is gone: stop reading and drop everything still queued
                connected_ = false;
                {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    writer_stop_ = true;
                    std::queue<std::string>().swap(write_queue_);
                }
                abort_pending();
                wake_reader();
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::report(std::exception_ptr e) {
    if (on_error_) on_error_(e);
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        // Non-blocking; a full pipe already guarantees a wakeup
        (void)!::write(wakeup_pipe_[1], &b, 1);
    }
}

void StdioTransport::abort_pending() {
    {
        std::lock_guard<std::mutex> lock(inbound_mutex_);
        session_.close();
        inbound_.clear();
    }
    inbound_cv_.notify_all();
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    // Also ends a drain that started at EOF
    if (running_) abort_pending();
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace vlive
