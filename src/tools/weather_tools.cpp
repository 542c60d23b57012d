#include "tool_base.hpp"
#include "tool_registry.hpp"

#include "../config.hpp"
#include "../logger.hpp"
#include "../weather/provider.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstdint>
#include <memory>
#include <string>

namespace mcp::tools {

namespace {

json location_schema(const char* description) {
    return json{{"type", "string"}, {"description", description}};
}

json units_schema() {
    return json{
        {"type", "string"},
        {"description", "metric (C, km/h), imperial (F, mph) or standard (K, m/s)"},
    };
}

class WeatherTool : public ToolHandler {
public:
    WeatherTool(weather::Provider& provider, weather::Units default_units)
        : provider_(provider), default_units_(default_units) {}

protected:
    weather::Provider& provider_;
    weather::Units default_units_;

    std::string location_argument(const json& arguments) const {
        return string_argument(arguments, "location", "London");
    }

    // Empty when "units" names no known system.
    std::optional<weather::Units> units_argument(const json& arguments) const {
        if (!arguments.contains("units")) {
            return default_units_;
        }
        return weather::parse_units(string_argument(arguments, "units", ""));
    }

    static DomainError unknown_units(const json& arguments) {
        return DomainError{"Unknown units: " + arguments.value("units", std::string())};
    }
};

class CurrentWeatherTool final : public WeatherTool {
public:
    using WeatherTool::WeatherTool;

    const char* name() const override { return "get_current_weather"; }

    ToolDescriptor descriptor() const override {
        return {name(), "Get current weather conditions for a location",
                json{
                    {"type", "object"},
                    {"properties", {{"location", location_schema("City name")}, {"units", units_schema()}}},
                    {"required", json::array({"location"})},
                }};
    }

    ToolResult invoke(const json& arguments) override {
        auto units = units_argument(arguments);
        if (!units) {
            return unknown_units(arguments);
        }
        return json(provider_.current(location_argument(arguments), *units));
    }
};

class ForecastTool final : public WeatherTool {
public:
    using WeatherTool::WeatherTool;

    const char* name() const override { return "get_forecast"; }

    ToolDescriptor descriptor() const override {
        return {name(), "Get weather forecast for multiple days",
                json{
                    {"type", "object"},
                    {"properties",
                     {
                         {"location", location_schema("City name")},
                         {"days", {{"type", "integer"}, {"default", 5}}},
                         {"units", units_schema()},
                     }},
                    {"required", json::array({"location"})},
                }};
    }

    ToolResult invoke(const json& arguments) override {
        auto units = units_argument(arguments);
        if (!units) {
            return unknown_units(arguments);
        }
        // Range is checked on the 64-bit value, before narrowing.
        int64_t days = integer_argument(arguments, "days", 5);
        if (days < 1 || days > weather::kMaxForecastDays) {
            return DomainError{"days must be between 1 and " + std::to_string(weather::kMaxForecastDays)};
        }
        auto forecast = provider_.forecast(location_argument(arguments), static_cast<int>(days), *units);
        if (forecast.empty()) {
            return DomainError{"No forecast data available"};
        }
        return json(forecast);
    }
};

class AlertsTool final : public WeatherTool {
public:
    using WeatherTool::WeatherTool;

    const char* name() const override { return "get_alerts"; }

    ToolDescriptor descriptor() const override {
        return {name(), "Get weather alerts for a location",
                json{
                    {"type", "object"},
                    {"properties", {{"location", location_schema("City name")}}},
                    {"required", json::array({"location"})},
                }};
    }

    ToolResult invoke(const json& arguments) override {
        return json(provider_.alerts(location_argument(arguments)));
    }
};

class AirQualityTool final : public WeatherTool {
public:
    using WeatherTool::WeatherTool;

    const char* name() const override { return "get_air_quality"; }

    ToolDescriptor descriptor() const override {
        return {name(), "Get air quality information",
                json{
                    {"type", "object"},
                    {"properties", {{"location", location_schema("City name")}}},
                    {"required", json::array({"location"})},
                }};
    }

    ToolResult invoke(const json& arguments) override {
        return json(provider_.air_quality(location_argument(arguments)));
    }
};

} // namespace

void register_weather_tools(ToolRegistry& registry, weather::Provider& provider, const ServerConfig& config) {
    registry.add(std::make_unique<CurrentWeatherTool>(provider, config.units));
    registry.add(std::make_unique<ForecastTool>(provider, config.units));
    registry.add(std::make_unique<AlertsTool>(provider, config.units));
    registry.add(std::make_unique<AirQualityTool>(provider, config.units));

    LOG4CPLUS_DEBUG(server_logger(), "Registered " << registry.size() << " weather tools");
}

} // namespace mcp::tools
