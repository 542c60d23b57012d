#pragma once

#include "provider.hpp"

#include "../rpc_client.hpp"

#include <optional>
#include <string>
#include <vector>

namespace weather {

/**
 * Typed view of the weather tools behind an RpcClient.
 *
 * A result carrying {"error": ...} is logged and returned as an empty
 * optional. Transport failures propagate as mcp::Error.
 */
class WeatherAgent {
public:
    WeatherAgent(mcp::RpcClient& client, Units units);

    /// Starts the client and checks that every weather tool is advertised.
    bool start();
    void stop();

    std::optional<CurrentConditions> current_weather(const std::string& location);
    std::optional<std::vector<DailyForecast>> forecast(const std::string& location, int days);
    std::optional<std::vector<Alert>> alerts(const std::string& location);
    std::optional<AirQuality> air_quality(const std::string& location);

    /// All four lookups for one location; a failed lookup appears as null.
    nlohmann::json analyze(const std::string& location);

    Units units() const { return units_; }

private:
    mcp::RpcClient& client_;
    Units units_;

    std::optional<nlohmann::json> call_tool(const std::string& name, const nlohmann::json& arguments);

    template <typename T>
    std::optional<T> call_as(const std::string& name, const nlohmann::json& arguments);
};

} // namespace weather
