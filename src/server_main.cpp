#include "config.hpp"
#include "dispatcher.hpp"
#include "logger.hpp"
#include "stdio_server.hpp"
#include "tools/tool_registry.hpp"
#include "weather/mock_provider.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <random>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    ServerConfig config;
    std::string error;
    if (!parse_server_options(argc, argv, config, error)) {
        fprintf(stderr, "error: %s\n", error.c_str());
        print_server_usage(argv[0]);
        return 1;
    }

    if (config.show_version) {
        std::cout << "Version: " << WEATHER_MCP_VERSION_STRING << std::endl;
        std::cout << "Commit: " << WEATHER_MCP_GIT_VERSION << std::endl;
        std::cout << "Build Time: " << WEATHER_MCP_BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (config.pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(config.log_config);

    const uint32_t seed = config.seed ? *config.seed : std::random_device{}();

    LOG4CPLUS_INFO(core_logger(), "weather_tool_server starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << WEATHER_MCP_VERSION_STRING << ", Commit: " << WEATHER_MCP_GIT_VERSION);
    LOG4CPLUS_INFO(core_logger(), "Default units: " << weather::units_name(config.units) << ", seed: " << seed);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (config.pdeathsig ? "enabled" : "disabled"));

    try {
        weather::MockProvider provider(seed);

        mcp::tools::ToolRegistry registry;
        mcp::tools::register_weather_tools(registry, provider, config);

        mcp::Dispatcher dispatcher(registry);
        mcp::StdioServer server([&dispatcher](const std::string& request_line, std::string& response_line) {
            response_line = dispatcher.handle_line(request_line);
        });

        LOG4CPLUS_INFO(core_logger(), "Serving " << registry.size() << " tools on stdin/stdout");
        int exit_code = server.run(std::cin, std::cout);
        LOG4CPLUS_INFO(core_logger(), "weather_tool_server shutting down");
        return exit_code;
    } catch (const std::exception& exc) {
        LOG4CPLUS_FATAL(core_logger(), "Fatal error: " << exc.what());
        return 1;
    }
}
