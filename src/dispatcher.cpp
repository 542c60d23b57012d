#include "dispatcher.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "tools/schema.hpp"

#include <log4cplus/loggingmacros.h>

#include <stdexcept>

namespace mcp {

namespace {

Response error_response(std::optional<int64_t> id, ErrorCode code, const std::string& message) {
    Response response;
    response.id = id;
    response.error = ErrorPayload{static_cast<int>(code), message};
    return response;
}

} // namespace

Dispatcher::Dispatcher(const tools::ToolRegistry& registry)
    : registry_(registry) {}

std::string Dispatcher::handle_line(const std::string& line) const {
    if (codec::trim(line).empty()) {
        return "";
    }

    Request request;
    try {
        request = codec::decode_request(codec::decode(line));
    } catch (const MalformedMessage& exc) {
        LOG4CPLUS_WARN(server_logger(), "Decode error: " << exc.what());
        return codec::encode_response(error_response(std::nullopt, ErrorCode::PARSE_ERROR, "Parse error"));
    }

    return codec::encode_response(handle_request(request));
}

Response Dispatcher::handle_request(const Request& request) const {
    LOG4CPLUS_INFO(server_logger(), "Request: " << request.method << " id=" << request.id);

    Response response;
    response.id = request.id;

    try {
        if (request.method == kMethodListTools) {
            response.result = list_tools();
        } else if (request.method == kMethodCallTool) {
            response.result = to_json(call_tool(request.params));
        } else {
            LOG4CPLUS_WARN(server_logger(), "Unknown method: " << request.method);
            response.result = to_json(DomainError{"Unknown method: " + request.method});
        }
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Internal error handling " << request.method << ": " << exc.what());
        return error_response(request.id, ErrorCode::INTERNAL_ERROR, exc.what());
    }

    return response;
}

json Dispatcher::list_tools() const {
    json tools = json::array();
    for (const auto& descriptor : registry_.descriptors()) {
        tools.push_back(to_json(descriptor));
    }
    return json{{"tools", tools}};
}

ToolResult Dispatcher::call_tool(const json& params) const {
    if (!params.is_object()) {
        throw std::invalid_argument("tools/call params must be an object");
    }

    const json* name_obj = codec::find_key(params, "name");
    if (!name_obj || !name_obj->is_string()) {
        return DomainError{"Missing tool name"};
    }
    std::string name = name_obj->get<std::string>();

    json arguments = json::object();
    if (const json* args_obj = codec::find_key(params, "arguments"); args_obj && !args_obj->is_null()) {
        arguments = *args_obj;
    }

    tools::ToolHandler* handler = registry_.find(name);
    if (!handler) {
        LOG4CPLUS_WARN(server_logger(), "Unknown tool: " << name);
        return DomainError{"Unknown tool: " + name};
    }

    if (auto violation = tools::validate_arguments(handler->descriptor().input_schema, arguments)) {
        LOG4CPLUS_WARN(server_logger(), name << ": " << *violation);
        return DomainError{*violation};
    }

    try {
        return handler->invoke(arguments);
    } catch (const std::exception& exc) {
        LOG4CPLUS_WARN(server_logger(), name << " failed: " << exc.what());
        return DomainError{exc.what()};
    } catch (...) {
        LOG4CPLUS_WARN(server_logger(), name << " failed with a non-standard exception");
        return DomainError{"Unknown tool failure"};
    }
}

} // namespace mcp
