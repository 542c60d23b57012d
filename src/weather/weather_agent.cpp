#include "weather_agent.hpp"

#include "../errors.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>

namespace weather {

namespace {

const char* const kRequiredTools[] = {"get_current_weather", "get_forecast", "get_alerts", "get_air_quality"};

} // namespace

WeatherAgent::WeatherAgent(mcp::RpcClient& client, Units units)
    : client_(client), units_(units) {}

bool WeatherAgent::start() {
    if (!client_.start()) {
        return false;
    }

    std::vector<mcp::ToolDescriptor> tools;
    try {
        tools = client_.list_tools();
    } catch (const mcp::Error& exc) {
        LOG4CPLUS_ERROR(client_logger(), "tools/list failed: " << exc.what());
        client_.stop();
        return false;
    }

    for (const char* required : kRequiredTools) {
        bool found = std::any_of(tools.begin(), tools.end(),
                                 [required](const mcp::ToolDescriptor& tool) { return tool.name == required; });
        if (!found) {
            LOG4CPLUS_ERROR(client_logger(), "Tool server does not provide " << required);
            client_.stop();
            return false;
        }
    }

    LOG4CPLUS_INFO(client_logger(), "Weather agent ready with " << tools.size() << " tools");
    return true;
}

void WeatherAgent::stop() {
    client_.stop();
}

std::optional<nlohmann::json> WeatherAgent::call_tool(const std::string& name, const nlohmann::json& arguments) {
    nlohmann::json result = client_.call_tool(name, arguments);
    if (result.is_object() && result.contains("error")) {
        LOG4CPLUS_WARN(client_logger(), name << " reported: " << result["error"].dump());
        return std::nullopt;
    }
    return result;
}

template <typename T>
std::optional<T> WeatherAgent::call_as(const std::string& name, const nlohmann::json& arguments) {
    auto result = call_tool(name, arguments);
    if (!result) {
        return std::nullopt;
    }

    try {
        return result->get<T>();
    } catch (const nlohmann::json::exception& exc) {
        throw mcp::MalformedMessage(name + " returned an unexpected result: " + exc.what());
    }
}

std::optional<CurrentConditions> WeatherAgent::current_weather(const std::string& location) {
    return call_as<CurrentConditions>("get_current_weather",
                                      {{"location", location}, {"units", units_name(units_)}});
}

std::optional<std::vector<DailyForecast>> WeatherAgent::forecast(const std::string& location, int days) {
    return call_as<std::vector<DailyForecast>>(
        "get_forecast", {{"location", location}, {"days", days}, {"units", units_name(units_)}});
}

std::optional<std::vector<Alert>> WeatherAgent::alerts(const std::string& location) {
    return call_as<std::vector<Alert>>("get_alerts", {{"location", location}});
}

std::optional<AirQuality> WeatherAgent::air_quality(const std::string& location) {
    return call_as<AirQuality>("get_air_quality", {{"location", location}});
}

nlohmann::json WeatherAgent::analyze(const std::string& location) {
    nlohmann::json analysis = {{"location", location}, {"units", units_}};

    auto current = current_weather(location);
    analysis["current"] = current ? nlohmann::json(*current) : nlohmann::json();

    auto days = forecast(location, 5);
    analysis["forecast"] = days ? nlohmann::json(*days) : nlohmann::json();

    auto active_alerts = alerts(location);
    analysis["alerts"] = active_alerts ? nlohmann::json(*active_alerts) : nlohmann::json();

    auto quality = air_quality(location);
    analysis["air_quality"] = quality ? nlohmann::json(*quality) : nlohmann::json();

    return analysis;
}

} // namespace weather
