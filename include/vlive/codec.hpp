#pragma once
#include "json_rpc.hpp"
#include "types.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace vlive {

/// Wire codec shared by both transports: JSON text <-> JSON-RPC envelopes, and
/// JSON-RPC envelopes <-> dispatcher-level Request / Result.
class Codec {
public:
    /// Parse one JSON-RPC message.
    /// Throws FramingError on invalid JSON or a malformed envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to compact JSON (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// tools/call request -> Request. Throws ProtocolError(InvalidParams) when
    /// the params are not {name: string, arguments?: ...}.
    [[nodiscard]] static Request to_request(const JsonRpcRequest& msg);

    /// Request -> tools/call request.
    [[nodiscard]] static JsonRpcRequest to_message(const Request& req);

    /// Success -> {content, structuredContent, isError:false};
    /// Failure -> JSON-RPC error {code, message, data}.
    [[nodiscard]] static JsonRpcResponse to_response(const Result& result);

    /// Inverse of to_response. Throws FramingError if the response carries
    /// neither result nor error.
    [[nodiscard]] static Result to_result(const JsonRpcResponse& resp);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace vlive
