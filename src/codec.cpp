#include "vlive/codec.hpp"
#include "vlive/error.hpp"
#include "vlive/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace vlive {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json parse_json(std::string_view raw) {
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw FramingError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw FramingError("Failed to get document value");
        }
        nlohmann::json j = simdjson_to_nlohmann(val.value());
        // One frame carries exactly one value
        if (!doc.at_end()) {
            throw FramingError("Unexpected content after JSON value");
        }
        return j;
    } catch (const FramingError&) {
        throw;
    } catch (const std::exception& e) {
        // simdjson_result::value() throws simdjson_error on malformed input
        throw FramingError(std::string("JSON parse error: ") + e.what());
    }
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw FramingError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw FramingError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method && !j.at("method").is_string()) {
        throw FramingError("'method' must be a string");
    }

    try {
        if (has_method && has_id) {
            if (j.at("id").is_null()) {
                throw FramingError("Request ID must not be null");
            }
            return j.get<JsonRpcRequest>();
        }
        if (has_method) {
            return j.get<JsonRpcNotification>();
        }
        if (has_id) {
            if (j.at("id").is_null()) {
                throw FramingError("Response ID must not be null");
            }
            return j.get<JsonRpcResponse>();
        }
    } catch (const FramingError&) {
        throw;
    } catch (const std::exception& e) {
        throw FramingError(std::string("Malformed message: ") + e.what());
    }
    throw FramingError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw FramingError("Empty input");
    }
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw FramingError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Request Codec::to_request(const JsonRpcRequest& msg) {
    if (!msg.params || !msg.params->is_object()) {
        throw ProtocolError(error::InvalidParams, "tools/call params must be an object");
    }
    const auto& params = *msg.params;
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        throw ProtocolError(error::InvalidParams, "tools/call requires a string 'name'");
    }

    Request req;
    req.id = msg.id;
    req.tool_name = name->get<std::string>();
    auto args = params.find("arguments");
    // Shape is checked by the validator, not here
    req.arguments = (args == params.end()) ? nlohmann::json::object() : *args;
    return req;
}

JsonRpcRequest Codec::to_message(const Request& req) {
    JsonRpcRequest msg;
    msg.id = req.id;
    msg.method = "tools/call";
    msg.params = nlohmann::json{{"name", req.tool_name}, {"arguments", req.arguments}};
    return msg;
}

JsonRpcResponse Codec::to_response(const Result& result) {
    JsonRpcResponse resp;
    resp.id = result.id;
    if (result.ok()) {
        const auto& payload = result.success().payload;
        nlohmann::json text_block = {
            {"type", "text"},
            {"text", payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)}
        };
        nlohmann::json body = nlohmann::json::object();
        body["content"] = nlohmann::json::array();
        body["content"].push_back(std::move(text_block));
        body["structuredContent"] = payload;
        body["isError"] = false;
        resp.result = std::move(body);
    } else {
        const auto& f = result.failure();
        resp.error = JsonRpcError{f.code, f.message, f.details};
    }
    return resp;
}

Result Codec::to_result(const JsonRpcResponse& resp) {
    Result result;
    result.id = resp.id;
    if (resp.error) {
        result.outcome = Failure{resp.error->code, resp.error->message, resp.error->data};
        return result;
    }
    if (!resp.result) {
        throw FramingError("Response carries neither result nor error");
    }
    const auto& r = *resp.result;
    if (r.is_object() && r.contains("structuredContent")) {
        result.outcome = Success{r.at("structuredContent")};
    } else {
        result.outcome = Success{r};
    }
    return result;
}

} // namespace vlive
