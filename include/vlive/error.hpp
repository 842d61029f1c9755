#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace vlive {

namespace error {
    // JSON-RPC 2.0
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;

    // Server-defined
    constexpr int ProtocolState    = -32000;
    constexpr int UnknownTool      = -32001;
    constexpr int HandlerError     = -32002;
    constexpr int HandlerTimeout   = -32003;
    constexpr int PayloadTooLarge  = -32004;
    constexpr int Handshake        = -32005;
    constexpr int ServerBusy       = -32006;
    constexpr int Cancelled        = -32800;

    /// Short stable name of a code, used in log records ("UnknownTool", ...).
    const char* code_name(int code) noexcept;
} // namespace error

class VliveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Inbound bytes could not be turned into a message.
class FramingError : public VliveError {
public:
    using VliveError::VliveError;
};

class TransportError : public VliveError {
public:
    using VliveError::VliveError;
};

class ConfigError : public VliveError {
public:
    using VliveError::VliveError;
};

/// Startup-time registration fault. Fatal before serving begins.
class DuplicateToolError : public VliveError {
public:
    explicit DuplicateToolError(const std::string& tool)
        : VliveError("Duplicate tool: " + tool), tool(tool) {}
    std::string tool;
};

class RegistrySealedError : public VliveError {
public:
    using VliveError::VliveError;
};

class SchemaError : public VliveError {
public:
    using VliveError::VliveError;
};

/// Base for every fault that is reported to the caller as a Failure.
class ProtocolError : public VliveError {
public:
    int code;
    std::optional<nlohmann::json> details;

    ProtocolError(int code, const std::string& msg,
                  std::optional<nlohmann::json> details = std::nullopt)
        : VliveError(msg), code(code), details(std::move(details)) {}
};

class ProtocolStateError : public ProtocolError {
public:
    explicit ProtocolStateError(const std::string& msg)
        : ProtocolError(error::ProtocolState, msg) {}
};

class HandshakeError : public ProtocolError {
public:
    explicit HandshakeError(const std::string& msg,
                            std::optional<nlohmann::json> details = std::nullopt)
        : ProtocolError(error::Handshake, msg, std::move(details)) {}
};

class UnknownToolError : public ProtocolError {
public:
    explicit UnknownToolError(const std::string& tool)
        : ProtocolError(error::UnknownTool, "Unknown tool: " + tool,
                        nlohmann::json{{"tool", tool}}),
          tool(tool) {}
    std::string tool;
};

class PayloadTooLargeError : public ProtocolError {
public:
    PayloadTooLargeError(size_t size, size_t limit)
        : ProtocolError(error::PayloadTooLarge,
                        "Payload of " + std::to_string(size) + " bytes exceeds limit of "
                            + std::to_string(limit),
                        nlohmann::json{{"size", size}, {"limit", limit}}) {}
};

/// Raised by tool handlers to report a structured fault.
class HandlerError : public ProtocolError {
public:
    explicit HandlerError(const std::string& msg,
                          std::optional<nlohmann::json> details = std::nullopt)
        : ProtocolError(error::HandlerError, msg, std::move(details)) {}
};

/// Argument validation failures. All map to InvalidParams and name the field.
class ArgumentError : public ProtocolError {
public:
    std::string field;

protected:
    ArgumentError(std::string field, const std::string& reason, const std::string& msg,
                  nlohmann::json extra = nlohmann::json::object())
        : ProtocolError(error::InvalidParams, msg, make_details(field, reason, std::move(extra))),
          field(std::move(field)) {}

private:
    static nlohmann::json make_details(const std::string& field, const std::string& reason,
                                       nlohmann::json extra) {
        extra["field"] = field;
        extra["reason"] = reason;
        return extra;
    }
};

class MissingArgumentError : public ArgumentError {
public:
    explicit MissingArgumentError(const std::string& field)
        : ArgumentError(field, "missing", "Missing required argument: " + field) {}
};

class TypeMismatchError : public ArgumentError {
public:
    TypeMismatchError(const std::string& field, const std::string& expected,
                      const std::string& actual)
        : ArgumentError(field, "type_mismatch",
                        "Argument '" + field + "' must be " + expected + ", got " + actual,
                        nlohmann::json{{"expected", expected}, {"actual", actual}}),
          expected(expected), actual(actual) {}
    std::string expected;
    std::string actual;
};

class UnexpectedArgumentError : public ArgumentError {
public:
    explicit UnexpectedArgumentError(const std::string& field)
        : ArgumentError(field, "unexpected", "Unexpected argument: " + field) {}
};

} // namespace vlive
