#pragma once

#include "weather/units.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// Built once in main and handed to the provider and tools; there is no global copy.
struct ServerConfig {
    std::string log_config = "log4cplus.ini";
    weather::Units units = weather::Units::Metric; // when a call gives no "units" argument
    std::optional<uint32_t> seed;
    bool pdeathsig = false;
    bool show_version = false;
};

struct AgentConfig {
    std::string log_config = "log4cplus.ini";
    std::string server_command;
    std::vector<std::string> server_args;
    int timeout_ms = 30000;
    weather::Units units = weather::Units::Metric;
    int days = 3;
    std::string location = "Washington DC";
    bool show_version = false;
};

/// WEATHER_UNITS seeds ServerConfig::units and AgentConfig::units before flags are applied.
bool parse_server_options(int argc, char** argv, ServerConfig& config, std::string& error);
bool parse_agent_options(int argc, char** argv, AgentConfig& config, std::string& error);

void print_server_usage(const char* program);
void print_agent_usage(const char* program);
