#include "json_codec.hpp"

#include "errors.hpp"

#include <limits>

namespace mcp::codec {

namespace {

json id_to_json(const std::optional<int64_t>& id) {
    if (id) {
        return *id;
    }
    return nullptr;
}

} // namespace

std::string encode(const json& message) {
    // dump() without indentation escapes control characters inside strings,
    // so the result never contains a raw newline.
    std::string line = message.dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

json decode(const std::string& line) {
    json message = json::parse(trim(line), nullptr, false);
    if (message.is_discarded()) {
        throw MalformedMessage("Parse error: invalid JSON");
    }
    if (!message.is_object()) {
        throw MalformedMessage("Parse error: message is not a JSON object");
    }
    return message;
}

std::string encode_request(const Request& request) {
    json message = {
        {"jsonrpc", request.protocol_version},
        {"method", request.method},
        {"params", request.params.is_null() ? json::object() : request.params},
        {"id", request.id},
    };
    return encode(message);
}

Request decode_request(const json& message) {
    Request request;
    if (const json* version = find_key(message, "jsonrpc")) {
        request.protocol_version = as_string(*version, kProtocolVersion);
    }

    const json* method = find_key(message, "method");
    if (!method || !method->is_string()) {
        throw MalformedMessage("Invalid request: missing method");
    }
    request.method = method->get<std::string>();

    if (const json* params = find_key(message, "params")) {
        request.params = *params;
    }

    const json* id = find_key(message, "id");
    if (!id || !id->is_number_integer()) {
        throw MalformedMessage("Invalid request: missing integer id");
    }
    request.id = id->get<int64_t>();
    return request;
}

std::string encode_response(const Response& response) {
    json message = {{"jsonrpc", response.protocol_version}};
    if (response.error) {
        message["error"] = {
            {"code", response.error->code},
            {"message", response.error->message},
        };
    } else {
        message["result"] = response.result ? *response.result : json();
    }
    message["id"] = id_to_json(response.id);
    return encode(message);
}

Response decode_response(const json& message) {
    Response response;
    if (const json* version = find_key(message, "jsonrpc")) {
        response.protocol_version = as_string(*version, kProtocolVersion);
    }

    const json* result = find_key(message, "result");
    const json* error = find_key(message, "error");
    if ((result == nullptr) == (error == nullptr)) {
        throw MalformedMessage("Invalid response: exactly one of result and error is required");
    }

    if (result) {
        response.result = *result;
    } else {
        const json* code = find_key(*error, "code");
        const json* text = find_key(*error, "message");
        if (!code || !code->is_number_integer() || !text || !text->is_string()) {
            throw MalformedMessage("Invalid response: malformed error object");
        }
        const int64_t code_value = as_int64(*code);
        if (code_value < std::numeric_limits<int>::min() || code_value > std::numeric_limits<int>::max()) {
            throw MalformedMessage("Invalid response: error code out of range");
        }
        response.error = ErrorPayload{static_cast<int>(code_value), text->get<std::string>()};
    }

    const json* id = find_key(message, "id");
    if (id && id->is_number_integer()) {
        response.id = id->get<int64_t>();
    } else if (id && !id->is_null()) {
        throw MalformedMessage("Invalid response: id must be an integer or null");
    }
    return response;
}

std::string trim(const std::string& text) {
    static const char* whitespace = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

const json* find_key(const json& object, const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const json& value, const std::string& fallback) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const json& value, int64_t fallback) {
    // Unsigned values above INT64_MAX saturate instead of wrapping negative.
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::numeric_limits<int64_t>::max();
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    return fallback;
}

double as_double(const json& value, double fallback) {
    if (value.is_number()) {
        return value.get<double>();
    }
    return fallback;
}

} // namespace mcp::codec
