#pragma once

#include "child_process.hpp"
#include "protocol.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mcp {

struct ClientConfig {
    std::string command;
    std::vector<std::string> args;
    int timeout_ms = 30000;       // bounded wait per call, negative waits forever
    int shutdown_grace_ms = ChildProcess::kDefaultGraceMs;
};

/**
 * JSON-RPC client over the stdio of one child process.
 *
 * At most one call is outstanding at a time: a request is written and the
 * caller blocks until its response is read, so the next decoded line always
 * answers the most recent request. A response carrying any other id is a
 * protocol violation and raises UnexpectedResponse. Concurrent calls would
 * need an id-keyed pending table and a dedicated reader thread.
 */
class RpcClient {
public:
    explicit RpcClient(ClientConfig config);
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    /// Spawn the server. Returns false instead of throwing when it cannot be launched.
    bool start();

    /// Release the child process. Safe before start and when called repeatedly.
    void stop();

    bool is_running();

    /**
     * Send one request and wait for its response.
     *
     * @return the response's result
     * @throws RemoteError the server answered with an error object
     * @throws TransportError not running, write failed, stream ended or the wait expired
     * @throws MalformedMessage a response line could not be decoded
     * @throws UnexpectedResponse a response carried another request's id
     */
    json call(const std::string& method, const json& params = json::object());

    std::vector<ToolDescriptor> list_tools();
    json call_tool(const std::string& name, const json& arguments);

    /// Last stderr lines of the current or most recently stopped server.
    std::vector<std::string> recent_diagnostics() const;

    const ClientConfig& config() const { return config_; }

private:
    ClientConfig config_;
    std::unique_ptr<ChildProcess> process_;
    int64_t request_id_counter_ = 0;
    std::vector<std::string> last_diagnostics_;

    int64_t next_request_id();
    json read_response(int64_t id);
    void abort_session(const std::string& reason);
};

} // namespace mcp
