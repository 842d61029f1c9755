#pragma once
#include "types.hpp"
#include "error.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace vlive {

/// Strict argument validation against a tool's InputSchema.
///
/// validate() returns the normalized argument object: every declared field that
/// was supplied, plus declared defaults for absent optional fields. It throws
///   MissingArgumentError    required field absent (or null),
///   TypeMismatchError       field present with the wrong JSON type,
///   UnexpectedArgumentError field not declared in the schema.
/// Declared fields are checked in schema order before undeclared ones.
class SchemaValidator {
public:
    [[nodiscard]] static nlohmann::json validate(const InputSchema& schema,
                                                 const nlohmann::json& arguments);

    /// True if `value` is acceptable for `type`. Integers satisfy Number.
    [[nodiscard]] static bool matches(ArgType type, const nlohmann::json& value);

    /// Check a schema for internal consistency (unique names, defaults of the
    /// declared type, no default on a required field). Throws SchemaError.
    static void check(const InputSchema& schema);
};

/// JSON type name used in error details ("string", "integer", "null", ...).
std::string json_type_name(const nlohmann::json& value);

/// Render as a JSON Schema object for discovery responses.
nlohmann::json to_json_schema(const InputSchema& schema);

/// Build an InputSchema from a flat JSON Schema object
/// ({"type":"object","properties":{...},"required":[...]}). Throws SchemaError.
InputSchema schema_from_json(const nlohmann::json& json_schema);

} // namespace vlive
