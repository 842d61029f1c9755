#pragma once
#include "cancellation.hpp"
#include "json_rpc.hpp"
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace vlive {

// ---------- Categories ----------

/// Fixed set of tool groups ("portmanteaus"). Declaration order is listing order.
enum class Category {
    Core,
    Shopping,
    Travel,
    Expenses,
    Media,
    Planning
};

constexpr size_t kCategoryCount = 6;

constexpr std::array<Category, kCategoryCount> kAllCategories = {
    Category::Core, Category::Shopping, Category::Travel,
    Category::Expenses, Category::Media, Category::Planning
};

std::string_view category_to_string(Category c);
std::optional<Category> category_from_string(std::string_view s);
std::string_view category_description(Category c);

// ---------- Input schema ----------

enum class ArgType {
    String,
    Integer,
    Number,
    Boolean,
    Object,
    Array
};

std::string_view arg_type_to_string(ArgType t);
std::optional<ArgType> arg_type_from_string(std::string_view s);

struct FieldSpec {
    std::string name;
    ArgType type = ArgType::String;
    bool required = false;
    std::optional<nlohmann::json> default_value;
    std::optional<std::string> description;

    bool operator==(const FieldSpec& o) const {
        return name == o.name && type == o.type && required == o.required
               && default_value == o.default_value && description == o.description;
    }
};

/// Ordered field list. Validation reports the first failing field in this order.
struct InputSchema {
    std::vector<FieldSpec> fields;

    [[nodiscard]] const FieldSpec* find(std::string_view name) const;

    bool operator==(const InputSchema& o) const { return fields == o.fields; }
};

// ---------- Tools ----------

/// Tool implementation. Receives validated arguments and a cooperative
/// cancellation token; throws HandlerError (or any exception) on failure.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json& arguments,
                                                 const CancellationToken& cancel)>;

struct ToolDescriptor {
    std::string name;
    Category category = Category::Core;
    std::optional<std::string> description;
    InputSchema input_schema;
    ToolHandler handler;
};

// ---------- Dispatch ----------

struct Request {
    RequestId id;
    std::string tool_name;
    nlohmann::json arguments = nlohmann::json::object();

    bool operator==(const Request& o) const {
        return id == o.id && tool_name == o.tool_name && arguments == o.arguments;
    }
};

struct Success {
    nlohmann::json payload;

    bool operator==(const Success& o) const { return payload == o.payload; }
};

struct Failure {
    int code;
    std::string message;
    std::optional<nlohmann::json> details;

    bool operator==(const Failure& o) const {
        return code == o.code && message == o.message && details == o.details;
    }
};

struct Result {
    RequestId id;
    std::variant<Success, Failure> outcome;

    [[nodiscard]] bool ok() const { return std::holds_alternative<Success>(outcome); }
    [[nodiscard]] const Success& success() const { return std::get<Success>(outcome); }
    [[nodiscard]] const Failure& failure() const { return std::get<Failure>(outcome); }

    bool operator==(const Result& o) const { return id == o.id && outcome == o.outcome; }
};

// ---------- Handshake ----------

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && title == o.title && version == o.version;
    }
};

/// Capabilities a client declares. Recorded on the session, otherwise unused.
struct ClientCapabilities {
    bool streaming = false;
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> sampling;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ClientCapabilities& o) const {
        return streaming == o.streaming && roots == o.roots && sampling == o.sampling
               && experimental == o.experimental;
    }
};

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> logging;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && logging == o.logging && experimental == o.experimental;
    }
};

struct HandshakeRequest {
    std::string protocol_version;
    ClientCapabilities capabilities;
    Implementation client_info;
};

struct HandshakeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    bool operator==(const HandshakeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info && instructions == o.instructions;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, Category c);
void from_json(const nlohmann::json& j, Category& c);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const ClientCapabilities& t);
void from_json(const nlohmann::json& j, ClientCapabilities& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const HandshakeRequest& t);
void from_json(const nlohmann::json& j, HandshakeRequest& t);

void to_json(nlohmann::json& j, const HandshakeResult& t);
void from_json(const nlohmann::json& j, HandshakeResult& t);

/// Discovery entry: {name, category, description?, inputSchema}.
void to_json(nlohmann::json& j, const ToolDescriptor& t);

} // namespace vlive
