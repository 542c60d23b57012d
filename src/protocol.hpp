#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcp {

using json = nlohmann::json;

inline constexpr const char* kProtocolVersion = "2.0";

inline constexpr const char* kMethodListTools = "tools/list";
inline constexpr const char* kMethodCallTool = "tools/call";

// JSON-RPC 2.0 error codes used on the wire
enum class ErrorCode : int {
    PARSE_ERROR    = -32700,
    INTERNAL_ERROR = -32603,
};

struct ErrorPayload {
    int code = 0;
    std::string message;
};

struct Request {
    std::string protocol_version = kProtocolVersion;
    std::string method;
    json params = json::object();
    int64_t id = 0;

    bool operator==(const Request& other) const {
        return protocol_version == other.protocol_version && method == other.method &&
               params == other.params && id == other.id;
    }
};

struct Response {
    std::string protocol_version = kProtocolVersion;
    std::optional<json> result;
    std::optional<ErrorPayload> error;
    std::optional<int64_t> id; // empty means null on the wire
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema = json::object();
};

json to_json(const ToolDescriptor& descriptor);
ToolDescriptor tool_descriptor_from_json(const json& value);

/// Failure of the operation behind a tool, reported as data inside a successful envelope.
struct DomainError {
    std::string message;
};

using ToolResult = std::variant<json, DomainError>;

/// Ok(value) serializes as the value itself, DomainError(message) as {"error": message}.
json to_json(const ToolResult& result);

} // namespace mcp
