#pragma once

#include "../protocol.hpp"

#include <string>

namespace mcp::tools {

class ToolHandler {
public:
    virtual ~ToolHandler() = default;
    virtual const char* name() const = 0;
    virtual ToolDescriptor descriptor() const = 0;

    /// Arguments have already been validated against descriptor().input_schema.
    /// Throwing is allowed; the dispatcher turns the exception into a domain error.
    virtual ToolResult invoke(const json& arguments) = 0;

protected:
    std::string string_argument(const json& arguments, const std::string& key, const std::string& fallback) const;
    int64_t integer_argument(const json& arguments, const std::string& key, int64_t fallback) const;
};

} // namespace mcp::tools
