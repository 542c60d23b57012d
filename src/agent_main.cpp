#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rpc_client.hpp"
#include "weather/report.hpp"
#include "weather/weather_agent.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace {

// Prefer the server built alongside this binary, then fall back to PATH lookup.
std::string default_server_command() {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        auto candidate = self.parent_path() / "weather_tool_server";
        if (std::filesystem::exists(candidate, ec)) {
            return candidate.string();
        }
    }
    return "weather_tool_server";
}

void print_report(weather::WeatherAgent& agent, const std::string& location, int days) {
    std::cout << "\nFetching weather for " << location << "...\n\n";

    if (auto current = agent.current_weather(location)) {
        std::cout << weather::format_current(*current);
    } else {
        std::cout << "Could not fetch weather for " << location << "\n";
    }

    if (auto forecast = agent.forecast(location, days)) {
        std::cout << "\n" << weather::format_forecast(location, *forecast, agent.units());
    }

    if (auto alerts = agent.alerts(location)) {
        std::cout << "\n" << weather::format_alerts(location, *alerts);
    }

    if (auto quality = agent.air_quality(location)) {
        std::cout << "\n" << weather::format_air_quality(*quality);
    }
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    AgentConfig config;
    std::string error;
    if (!parse_agent_options(argc, argv, config, error)) {
        fprintf(stderr, "error: %s\n", error.c_str());
        print_agent_usage(argv[0]);
        return 1;
    }

    if (config.show_version) {
        std::cout << "Version: " << WEATHER_MCP_VERSION_STRING << std::endl;
        std::cout << "Commit: " << WEATHER_MCP_GIT_VERSION << std::endl;
        std::cout << "Build Time: " << WEATHER_MCP_BUILD_TIMESTAMP << std::endl;
        return 0;
    }

    init_logging(config.log_config);

    mcp::ClientConfig client_config;
    client_config.command = config.server_command.empty() ? default_server_command() : config.server_command;
    client_config.args = config.server_args;
    client_config.timeout_ms = config.timeout_ms;

    LOG4CPLUS_INFO(core_logger(), "weather_agent starting, server: " << client_config.command);

    mcp::RpcClient client(client_config);
    weather::WeatherAgent agent(client, config.units);

    if (!agent.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start weather agent");
        return 1;
    }

    int exit_code = 0;
    try {
        print_report(agent, config.location, config.days);
    } catch (const mcp::Error& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Weather lookup failed: " << exc.what());
        exit_code = 1;
    }

    agent.stop();
    return exit_code;
}
