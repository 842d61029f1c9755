#include "vlive/types.hpp"
#include "vlive/schema.hpp"
#include <stdexcept>

namespace vlive {

// ---------- Category ----------

std::string_view category_to_string(Category c) {
    switch (c) {
        case Category::Core:     return "core";
        case Category::Shopping: return "shopping_manager";
        case Category::Travel:   return "travel_manager";
        case Category::Expenses: return "expenses_manager";
        case Category::Media:    return "media_manager";
        case Category::Planning: return "planning_manager";
    }
    return "core";
}

std::optional<Category> category_from_string(std::string_view s) {
    for (auto c : kAllCategories) {
        if (category_to_string(c) == s) return c;
    }
    return std::nullopt;
}

std::string_view category_description(Category c) {
    switch (c) {
        case Category::Core:
            return "Server status and catalog introspection";
        case Category::Shopping:
            return "Shopping management with offers, lists, and budget tracking";
        case Category::Travel:
            return "Travel planning with transport, weather, and booking";
        case Category::Expenses:
            return "Expense tracking, analysis, and budget management";
        case Category::Media:
            return "Unified media management across Plex, Calibre, and Immich";
        case Category::Planning:
            return "Personal planning and productivity management";
    }
    return "";
}

void to_json(nlohmann::json& j, Category c) {
    j = std::string(category_to_string(c));
}

void from_json(const nlohmann::json& j, Category& c) {
    auto parsed = category_from_string(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("Unknown category: " + j.get<std::string>());
    }
    c = *parsed;
}

// ---------- ArgType ----------

std::string_view arg_type_to_string(ArgType t) {
    switch (t) {
        case ArgType::String:  return "string";
        case ArgType::Integer: return "integer";
        case ArgType::Number:  return "number";
        case ArgType::Boolean: return "boolean";
        case ArgType::Object:  return "object";
        case ArgType::Array:   return "array";
    }
    return "string";
}

std::optional<ArgType> arg_type_from_string(std::string_view s) {
    if (s == "string")  return ArgType::String;
    if (s == "integer") return ArgType::Integer;
    if (s == "number")  return ArgType::Number;
    if (s == "boolean") return ArgType::Boolean;
    if (s == "object")  return ArgType::Object;
    if (s == "array")   return ArgType::Array;
    return std::nullopt;
}

const FieldSpec* InputSchema::find(std::string_view name) const {
    for (const auto& f : fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
    if (j.contains("title")) t.title = j.at("title").get<std::string>();
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ClientCapabilities& t) {
    j = nlohmann::json::object();
    if (t.streaming) j["streaming"] = true;
    if (t.roots) j["roots"] = *t.roots;
    if (t.sampling) j["sampling"] = *t.sampling;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ClientCapabilities& t) {
    if (j.contains("streaming") && j.at("streaming").is_boolean()) {
        t.streaming = j.at("streaming").get<bool>();
    }
    if (j.contains("roots")) t.roots = j.at("roots");
    if (j.contains("sampling")) t.sampling = j.at("sampling");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
    if (t.logging) j["logging"] = *t.logging;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("logging")) t.logging = j.at("logging");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

// ---------- Handshake ----------

void to_json(nlohmann::json& j, const HandshakeRequest& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"clientInfo", t.client_info}
    };
}

void from_json(const nlohmann::json& j, HandshakeRequest& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    if (j.contains("capabilities")) t.capabilities = j.at("capabilities").get<ClientCapabilities>();
    if (j.contains("clientInfo")) t.client_info = j.at("clientInfo").get<Implementation>();
}

void to_json(nlohmann::json& j, const HandshakeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, HandshakeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

// ---------- ToolDescriptor ----------

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = {
        {"name", t.name},
        {"category", t.category},
        {"inputSchema", to_json_schema(t.input_schema)}
    };
    if (t.description) j["description"] = *t.description;
}

} // namespace vlive
