#include "schema.hpp"

#include "../json_codec.hpp"

namespace mcp::tools {

namespace {

bool matches_type(const json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    return true;
}

} // namespace

std::optional<std::string> validate_arguments(const json& schema, const json& arguments) {
    if (!arguments.is_object()) {
        return std::string("Tool arguments must be an object");
    }

    if (const json* required = codec::find_key(schema, "required"); required && required->is_array()) {
        for (const auto& name : *required) {
            if (name.is_string() && !arguments.contains(name.get<std::string>())) {
                return "Missing required argument: " + name.get<std::string>();
            }
        }
    }

    const json* properties = codec::find_key(schema, "properties");
    if (!properties || !properties->is_object()) {
        return std::nullopt;
    }

    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        const json* property = codec::find_key(*properties, it.key());
        if (!property) {
            continue;
        }
        const json* type_value = codec::find_key(*property, "type");
        std::string type = type_value ? codec::as_string(*type_value, "") : "";
        if (!type.empty() && !matches_type(it.value(), type)) {
            return "Invalid type for argument '" + it.key() + "': expected " + type;
        }
    }
    return std::nullopt;
}

} // namespace mcp::tools
