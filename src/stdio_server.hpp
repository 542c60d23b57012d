#pragma once

#include <functional>
#include <iosfwd>
#include <string>

namespace mcp {

class StdioServer {
public:
    /// Fills response_line for request_line; an empty response writes nothing.
    using RequestHandler = std::function<void(const std::string& request_line, std::string& response_line)>;

    explicit StdioServer(RequestHandler handler);

    /**
     * Serve until end of input.
     *
     * Each response is flushed before the next line is read, since the
     * client blocks until it sees the whole line.
     *
     * @return 0 at end of input, 1 if the output stream failed
     */
    int run(std::istream& in, std::ostream& out);

    size_t handled() const { return handled_; }

private:
    RequestHandler handler_;
    size_t handled_ = 0;
};

} // namespace mcp
