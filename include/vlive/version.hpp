#pragma once
#include <array>
#include <string_view>

namespace vlive {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Protocol revisions accepted during the handshake, newest first.
constexpr std::array<std::string_view, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18", "2025-03-26", "2024-11-05"
};

inline bool is_supported_protocol_version(std::string_view v) {
    for (auto s : SUPPORTED_PROTOCOL_VERSIONS) {
        if (s == v) return true;
    }
    return false;
}

} // namespace vlive
