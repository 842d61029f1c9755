#include "vlive/session.hpp"
#include "vlive/error.hpp"
#include "vlive/version.hpp"
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace vlive {

std::string_view session_state_to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Ready:         return "ready";
        case SessionState::Closed:        return "closed";
    }
    return "closed";
}

std::string generate_session_id() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

Session::Session() : id_(generate_session_id()) {
}

Session::Session(std::string id) : id_(std::move(id)) {
}

Session::~Session() {
    close();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Session::handshake(const HandshakeRequest& req) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Closed) {
        throw ProtocolStateError("Session is closed");
    }
    if (state_ == SessionState::Ready) {
        throw ProtocolStateError("Session is already initialized");
    }
    if (!is_supported_protocol_version(req.protocol_version)) {
        nlohmann::json supported = nlohmann::json::array();
        for (auto v : SUPPORTED_PROTOCOL_VERSIONS) supported.push_back(std::string(v));
        throw HandshakeError("Unsupported protocol version: " + req.protocol_version,
                             nlohmann::json{{"requested", req.protocol_version},
                                            {"supported", supported}});
    }
    protocol_version_ = req.protocol_version;
    client_caps_ = req.capabilities;
    client_info_ = req.client_info;
    state_ = SessionState::Ready;
    return protocol_version_;
}

void Session::assume_ready(const std::string& version) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Uninitialized) {
        throw ProtocolStateError("Session is not uninitialized");
    }
    protocol_version_ = version;
    state_ = SessionState::Ready;
}

void Session::close() {
    std::vector<CancellationSource> to_cancel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed) return;
        state_ = SessionState::Closed;
        for (auto& [k, src] : in_flight_) to_cancel.push_back(src);
    }
    closed_.cancel();
    for (auto& src : to_cancel) src.cancel();
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

ClientCapabilities Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

Implementation Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

std::string Session::key(const RequestId& id) {
    // Prefix keeps integer 1 and string "1" apart
    if (auto* i = std::get_if<int64_t>(&id)) return "i:" + std::to_string(*i);
    return "s:" + std::get<std::string>(id);
}

CancellationSource Session::begin_request(const RequestId& id) {
    CancellationSource src;
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed = state_ == SessionState::Closed;
        if (!closed) in_flight_.emplace(key(id), src);
    }
    if (closed) src.cancel();
    return src;
}

void Session::end_request(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(key(id));
    if (it != in_flight_.end()) in_flight_.erase(it);
}

bool Session::cancel_request(const RequestId& id) {
    std::vector<CancellationSource> to_cancel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto range = in_flight_.equal_range(key(id));
        for (auto it = range.first; it != range.second; ++it) to_cancel.push_back(it->second);
    }
    for (auto& src : to_cancel) src.cancel();
    return !to_cancel.empty();
}

size_t Session::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

} // namespace vlive
