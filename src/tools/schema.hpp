#pragma once

#include "../protocol.hpp"

#include <optional>
#include <string>

namespace mcp::tools {

/**
 * Check arguments against a JSON-schema-like object.
 *
 * Supports "required" and the "type" of each entry in "properties"
 * (string, integer, number, boolean, object, array). Undeclared
 * arguments are accepted.
 *
 * @return a message describing the first violation, or nothing if valid
 */
std::optional<std::string> validate_arguments(const json& schema, const json& arguments);

} // namespace mcp::tools
