#include "stdio_server.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <istream>
#include <ostream>

namespace mcp {

StdioServer::StdioServer(RequestHandler handler)
    : handler_(std::move(handler)) {}

int StdioServer::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        std::string response;

        try {
            handler_(line, response);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(server_logger(), "Handler error: " << exc.what());
            Response failure;
            failure.error = ErrorPayload{static_cast<int>(ErrorCode::INTERNAL_ERROR), exc.what()};
            response = codec::encode_response(failure);
        }

        if (response.empty()) {
            continue;
        }

        out << response;
        out.flush();
        if (!out) {
            LOG4CPLUS_ERROR(server_logger(), "Failed to write response, stopping");
            return 1;
        }
        ++handled_;
    }

    LOG4CPLUS_INFO(server_logger(), "End of input after " << handled_ << " responses");
    return 0;
}

} // namespace mcp
