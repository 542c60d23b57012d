#pragma once

#include "protocol.hpp"
#include "tools/tool_registry.hpp"

#include <string>

namespace mcp {

/**
 * Turns one request line into exactly one response line.
 *
 * Unknown tools, unknown methods and tool exceptions are reported as
 * {"error": ...} inside a successful result. Only undecodable input
 * (-32700) and unexpected failures outside a tool (-32603) use the
 * JSON-RPC error object.
 */
class Dispatcher {
public:
    explicit Dispatcher(const tools::ToolRegistry& registry);

    /// Empty for blank input, otherwise one encoded response ending in '\n'.
    std::string handle_line(const std::string& line) const;

    Response handle_request(const Request& request) const;

private:
    const tools::ToolRegistry& registry_;

    json list_tools() const;
    ToolResult call_tool(const json& params) const;
};

} // namespace mcp
