#pragma once
#include <exception>
#include <functional>

namespace vlive {

class Router;

/// Receives asynchronous transport faults (framing, oversized frames, I/O).
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Transport adapter. Owns the sessions it creates and feeds their messages
/// through the shared Router.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start serving. Blocks until the peer disconnects or shutdown() is called.
    virtual void start(Router& router, ErrorCallback on_error = nullptr) = 0;

    /// Graceful shutdown. Safe to call from any thread, also before start().
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace vlive
