#include "vlive/schema.hpp"
#include <set>

namespace vlive {

std::string json_type_name(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:            return "null";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float:    return "number";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::object:          return "object";
        default:                                       return "unknown";
    }
}

bool SchemaValidator::matches(ArgType type, const nlohmann::json& value) {
    switch (type) {
        case ArgType::String:  return value.is_string();
        case ArgType::Integer: return value.is_number_integer();
        case ArgType::Number:  return value.is_number();
        case ArgType::Boolean: return value.is_boolean();
        case ArgType::Object:  return value.is_object();
        case ArgType::Array:   return value.is_array();
    }
    return false;
}

nlohmann::json SchemaValidator::validate(const InputSchema& schema,
                                         const nlohmann::json& arguments) {
    // Absent arguments are treated as an empty object
    if (!arguments.is_null() && !arguments.is_object()) {
        throw TypeMismatchError("arguments", "object", json_type_name(arguments));
    }
    const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json& args = arguments.is_null() ? empty : arguments;

    nlohmann::json normalized = nlohmann::json::object();

    for (const auto& field : schema.fields) {
        auto it = args.find(field.name);
        bool absent = it == args.end() || it->is_null();

        if (absent) {
            if (field.required) {
                throw MissingArgumentError(field.name);
            }
            if (field.default_value) {
                normalized[field.name] = *field.default_value;
            }
            continue;
        }

        if (!matches(field.type, *it)) {
            throw TypeMismatchError(field.name, std::string(arg_type_to_string(field.type)),
                                    json_type_name(*it));
        }
        normalized[field.name] = *it;
    }

    for (auto it = args.begin(); it != args.end(); ++it) {
        if (!schema.find(it.key())) {
            throw UnexpectedArgumentError(it.key());
        }
    }

    return normalized;
}

void SchemaValidator::check(const InputSchema& schema) {
    std::set<std::string> seen;
    for (const auto& field : schema.fields) {
        if (field.name.empty()) {
            throw SchemaError("Field name must not be empty");
        }
        if (!seen.insert(field.name).second) {
            throw SchemaError("Duplicate field: " + field.name);
        }
        if (field.default_value) {
            if (field.required) {
                throw SchemaError("Required field '" + field.name + "' cannot have a default");
            }
            if (!matches(field.type, *field.default_value)) {
                throw SchemaError("Default for '" + field.name + "' is not of type "
                                  + std::string(arg_type_to_string(field.type)));
            }
        }
    }
}

nlohmann::json to_json_schema(const InputSchema& schema) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& field : schema.fields) {
        nlohmann::json prop = {{"type", std::string(arg_type_to_string(field.type))}};
        if (field.description) prop["description"] = *field.description;
        if (field.default_value) prop["default"] = *field.default_value;
        properties[field.name] = std::move(prop);
        if (field.required) required.push_back(field.name);
    }

    nlohmann::json j = {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"additionalProperties", false}
    };
    if (!required.empty()) j["required"] = std::move(required);
    return j;
}

InputSchema schema_from_json(const nlohmann::json& json_schema) {
    if (!json_schema.is_object()) {
        throw SchemaError("Input schema must be a JSON object");
    }
    if (json_schema.contains("type") && json_schema.at("type") != "object") {
        throw SchemaError("Input schema type must be 'object'");
    }

    std::set<std::string> required;
    if (json_schema.contains("required")) {
        for (const auto& r : json_schema.at("required")) {
            if (!r.is_string()) throw SchemaError("'required' entries must be strings");
            required.insert(r.get<std::string>());
        }
    }

    InputSchema schema;
    if (json_schema.contains("properties")) {
        const auto& props = json_schema.at("properties");
        if (!props.is_object()) throw SchemaError("'properties' must be an object");
        for (auto it = props.begin(); it != props.end(); ++it) {
            const auto& p = it.value();
            if (!p.is_object() || !p.contains("type") || !p.at("type").is_string()) {
                throw SchemaError("Property '" + it.key() + "' needs a string 'type'");
            }
            auto type = arg_type_from_string(p.at("type").get<std::string>());
            if (!type) {
                throw SchemaError("Property '" + it.key() + "' has unsupported type "
                                  + p.at("type").get<std::string>());
            }
            FieldSpec field;
            field.name = it.key();
            field.type = *type;
            field.required = required.count(field.name) > 0;
            if (p.contains("default")) field.default_value = p.at("default");
            if (p.contains("description") && p.at("description").is_string()) {
                field.description = p.at("description").get<std::string>();
            }
            schema.fields.push_back(std::move(field));
            required.erase(it.key());
        }
    }
    if (!required.empty()) {
        throw SchemaError("Required field without property: " + *required.begin());
    }

    SchemaValidator::check(schema);
    return schema;
}

} // namespace vlive
