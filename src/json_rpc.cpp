#include "vlive/json_rpc.hpp"
#include "vlive/version.hpp"

namespace vlive {

std::string to_string(const RequestId& id) {
    if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return std::get<std::string>(id);
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    to_json(j["id"], r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    to_json(j["id"], r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    n.method = j.at("method").get<std::string>();
    if (j.contains("params")) n.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

nlohmann::json make_unidentified_error(int code, const std::string& message,
                                       std::optional<nlohmann::json> data) {
    JsonRpcError err{code, message, std::move(data)};
    return nlohmann::json{
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", nullptr},
        {"error", err}
    };
}

} // namespace vlive
