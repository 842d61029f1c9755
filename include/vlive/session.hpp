#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "cancellation.hpp"
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace vlive {

enum class SessionState {
    Uninitialized,
    Ready,
    Closed
};

std::string_view session_state_to_string(SessionState s);

/// Random UUID v4 string.
std::string generate_session_id();

/// One logical conversation with a caller. Owned by the transport adapter that
/// created it; safe to share with concurrent dispatches of the same session.
class Session {
public:
    Session();
    explicit Session(std::string id);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }

    [[nodiscard]] SessionState state() const;

    /// Uninitialized -> Ready. Negotiates the protocol version and records the
    /// client's capabilities. Returns the agreed version.
    /// Throws ProtocolStateError when not Uninitialized, HandshakeError on an
    /// unsupported version (the session stays Uninitialized).
    std::string handshake(const HandshakeRequest& req);

    /// Uninitialized -> Ready without a handshake message, at `version`.
    void assume_ready(const std::string& version);

    /// Any state -> Closed. Idempotent. Cancels every in-flight invocation.
    void close();

    [[nodiscard]] std::string protocol_version() const;
    [[nodiscard]] ClientCapabilities client_capabilities() const;
    [[nodiscard]] Implementation client_info() const;

    /// Cancelled when the session closes.
    [[nodiscard]] CancellationToken token() const { return closed_.token(); }

    // ---- In-flight invocations ----

    /// Track an invocation and return its cancellation source. The source is
    /// already cancelled if the session is closed.
    CancellationSource begin_request(const RequestId& id);
    void end_request(const RequestId& id);

    /// Cancel an in-flight invocation by id. False if none is running.
    bool cancel_request(const RequestId& id);

    [[nodiscard]] size_t in_flight() const;

private:
    static std::string key(const RequestId& id);

    const std::string id_;
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::string protocol_version_;
    ClientCapabilities client_caps_;
    Implementation client_info_;
    CancellationSource closed_;
    std::multimap<std::string, CancellationSource> in_flight_;
};

} // namespace vlive
