#include "rpc_client.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <chrono>

namespace mcp {

RpcClient::RpcClient(ClientConfig config)
    : config_(std::move(config)) {}

RpcClient::~RpcClient() {
    stop();
}

bool RpcClient::start() {
    if (process_) {
        return true;
    }

    auto process = std::make_unique<ChildProcess>();
    try {
        process->start(config_.command, config_.args);
    } catch (const SpawnFailure& exc) {
        LOG4CPLUS_ERROR(client_logger(), "Failed to start tool server: " << exc.what());
        return false;
    }

    LOG4CPLUS_INFO(client_logger(), "Tool server started: " << config_.command << " pid=" << process->pid());
    process_ = std::move(process);
    return true;
}

void RpcClient::stop() {
    if (!process_) {
        return;
    }

    process_->stop(config_.shutdown_grace_ms);
    last_diagnostics_ = process_->recent_diagnostics();
    LOG4CPLUS_INFO(client_logger(), "Tool server stopped, exit code " << process_->exit_code().value_or(-1));
    process_.reset();
}

bool RpcClient::is_running() {
    return process_ && process_->is_running();
}

int64_t RpcClient::next_request_id() {
    return ++request_id_counter_;
}

json RpcClient::call(const std::string& method, const json& params) {
    if (!process_) {
        throw TransportError("Tool server is not running");
    }

    Request request;
    request.method = method;
    request.params = params;
    request.id = next_request_id();

    LOG4CPLUS_DEBUG(client_logger(), "-> " << method << " id=" << request.id);

    try {
        process_->write_line(codec::encode_request(request));
    } catch (const BrokenPipe& exc) {
        abort_session(exc.what());
        throw TransportError(std::string("Failed to send request: ") + exc.what());
    }

    return read_response(request.id);
}

json RpcClient::read_response(int64_t id) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(config_.timeout_ms < 0 ? 0 : config_.timeout_ms);

    while (true) {
        int wait_ms = -1;
        if (config_.timeout_ms >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            wait_ms = remaining > 0 ? static_cast<int>(remaining) : 0;
        }

        std::string line;
        auto status = process_->read_line(line, wait_ms);

        if (status == ChildProcess::ReadStatus::EndOfStream) {
            std::string reason = "Tool server closed its output before answering request " + std::to_string(id);
            abort_session(reason);
            throw TransportError(reason);
        }
        if (status == ChildProcess::ReadStatus::Timeout) {
            std::string reason = "No response to request " + std::to_string(id) + " within " +
                                 std::to_string(config_.timeout_ms) + " ms";
            abort_session(reason);
            throw TransportError(reason);
        }

        if (codec::trim(line).empty()) {
            continue;
        }

        Response response;
        try {
            response = codec::decode_response(codec::decode(line));
        } catch (const MalformedMessage& exc) {
            abort_session(exc.what());
            throw;
        }

        if (response.id && *response.id != id) {
            UnexpectedResponse violation(id, response.id);
            abort_session(violation.what());
            throw violation;
        }

        if (response.error) {
            LOG4CPLUS_DEBUG(client_logger(), "<- error " << response.error->code << " id=" << id);
            throw RemoteError(response.error->code, response.error->message);
        }

        if (!response.id) {
            UnexpectedResponse violation(id, std::nullopt);
            abort_session(violation.what());
            throw violation;
        }

        LOG4CPLUS_DEBUG(client_logger(), "<- result id=" << id);
        return std::move(*response.result);
    }
}

void RpcClient::abort_session(const std::string& reason) {
    LOG4CPLUS_WARN(client_logger(), "Ending tool server session: " << reason);
    if (process_) {
        for (const auto& line : process_->recent_diagnostics()) {
            LOG4CPLUS_WARN(client_logger(), "  server stderr: " << line);
        }
    }
    stop();
}

std::vector<ToolDescriptor> RpcClient::list_tools() {
    json result = call(kMethodListTools, json::object());

    const json* tools = codec::find_key(result, "tools");
    if (!tools || !tools->is_array()) {
        throw MalformedMessage("tools/list result has no tools array");
    }

    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(tools->size());
    for (const auto& entry : *tools) {
        descriptors.push_back(tool_descriptor_from_json(entry));
    }
    return descriptors;
}

json RpcClient::call_tool(const std::string& name, const json& arguments) {
    return call(kMethodCallTool, json{{"name", name}, {"arguments", arguments}});
}

std::vector<std::string> RpcClient::recent_diagnostics() const {
    if (process_) {
        return process_->recent_diagnostics();
    }
    return last_diagnostics_;
}

} // namespace mcp
