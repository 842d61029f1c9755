#include "vlive/error.hpp"

namespace vlive::error {

const char* code_name(int code) noexcept {
    switch (code) {
        case ParseError:      return "ParseError";
        case InvalidRequest:  return "InvalidRequest";
        case MethodNotFound:  return "MethodNotFound";
        case InvalidParams:   return "InvalidArgument";
        case InternalError:   return "InternalError";
        case ProtocolState:   return "ProtocolStateError";
        case UnknownTool:     return "UnknownTool";
        case HandlerError:    return "HandlerError";
        case HandlerTimeout:  return "HandlerTimeout";
        case PayloadTooLarge: return "PayloadTooLarge";
        case Handshake:       return "HandshakeError";
        case ServerBusy:      return "ServerBusy";
        case Cancelled:       return "Cancelled";
        default:              return "Unknown";
    }
}

} // namespace vlive::error
