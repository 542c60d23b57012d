#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcp {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A line that is not a JSON object, or an object that is not a valid envelope.
class MalformedMessage : public Error {
public:
    using Error::Error;
};

/// The child process could not be started.
class SpawnFailure : public Error {
public:
    using Error::Error;
};

/// The child closed its input or has exited.
class BrokenPipe : public Error {
public:
    using Error::Error;
};

/// The session is gone: not started, stream ended, write failed or the wait expired.
class TransportError : public Error {
public:
    using Error::Error;
};

/// The server answered with a JSON-RPC error object.
class RemoteError : public Error {
public:
    RemoteError(int code, const std::string& message)
        : Error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

/// A response whose id does not belong to the call in flight.
class UnexpectedResponse : public Error {
public:
    UnexpectedResponse(int64_t expected_id, std::optional<int64_t> received_id)
        : Error("Unexpected response id " + (received_id ? std::to_string(*received_id) : std::string("null")) +
                " while waiting for " + std::to_string(expected_id)),
          expected_id_(expected_id),
          received_id_(received_id) {}

    int64_t expected_id() const { return expected_id_; }
    std::optional<int64_t> received_id() const { return received_id_; }

private:
    int64_t expected_id_;
    std::optional<int64_t> received_id_;
};

} // namespace mcp
