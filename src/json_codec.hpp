#pragma once

#include "protocol.hpp"

#include <string>

namespace mcp::codec {

/// Compact single-line JSON terminated by exactly one '\n'.
std::string encode(const json& message);

/// Throws MalformedMessage if the trimmed line is not a JSON object.
json decode(const std::string& line);

std::string encode_request(const Request& request);
Request decode_request(const json& message);

std::string encode_response(const Response& response);
Response decode_response(const json& message);

std::string trim(const std::string& text);

const json* find_key(const json& object, const std::string& key);
std::string as_string(const json& value, const std::string& fallback = "");
int64_t as_int64(const json& value, int64_t fallback = 0);
double as_double(const json& value, double fallback = 0.0);

} // namespace mcp::codec
