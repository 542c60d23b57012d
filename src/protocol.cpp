#include "protocol.hpp"

#include "errors.hpp"

namespace mcp {

json to_json(const ToolDescriptor& descriptor) {
    return json{
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"inputSchema", descriptor.input_schema},
    };
}

ToolDescriptor tool_descriptor_from_json(const json& value) {
    if (!value.is_object() || !value.contains("name") || !value["name"].is_string()) {
        throw MalformedMessage("Invalid tool descriptor: missing name");
    }

    ToolDescriptor descriptor;
    descriptor.name = value["name"].get<std::string>();
    if (value.contains("description") && value["description"].is_string()) {
        descriptor.description = value["description"].get<std::string>();
    }
    if (value.contains("inputSchema") && value["inputSchema"].is_object()) {
        descriptor.input_schema = value["inputSchema"];
    }
    return descriptor;
}

json to_json(const ToolResult& result) {
    if (const auto* error = std::get_if<DomainError>(&result)) {
        return json{{"error", error->message}};
    }
    return std::get<json>(result);
}

} // namespace mcp
