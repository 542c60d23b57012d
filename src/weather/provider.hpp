#pragma once

#include "units.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace weather {

// Forecasts cover 1..kMaxForecastDays days starting today.
inline constexpr int kMaxForecastDays = 16;

struct CurrentConditions {
    std::string location;
    double temperature = 0.0;
    double feels_like = 0.0;
    int humidity = 0;
    double wind_speed = 0.0;
    std::string condition;
    std::string description;
    Units units = Units::Metric;
    std::string timestamp;
};

struct DailyForecast {
    std::string date;
    double temp_max = 0.0;
    double temp_min = 0.0;
    std::string condition;
    double precipitation = 0.0;
    double wind_speed = 0.0;
};

struct Alert {
    std::string title;
    std::string severity;
    std::string description;
    std::string effective_from;
    std::string expires;
};

struct AirQuality {
    std::string location;
    int aqi = 0;
    double pm25 = 0.0;
    double pm10 = 0.0;
    double no2 = 0.0;
    double so2 = 0.0;
    double o3 = 0.0;
    std::string quality;
    std::string timestamp;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CurrentConditions, location, temperature, feels_like, humidity, wind_speed,
                                   condition, description, units, timestamp)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DailyForecast, date, temp_max, temp_min, condition, precipitation, wind_speed)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Alert, title, severity, description, effective_from, expires)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AirQuality, location, aqi, pm25, pm10, no2, so2, o3, quality, timestamp)

/// Source of weather data behind the tools. Implementations may throw on bad input.
class Provider {
public:
    virtual ~Provider() = default;

    virtual CurrentConditions current(const std::string& location, Units units) = 0;
    virtual std::vector<DailyForecast> forecast(const std::string& location, int days, Units units) = 0;
    virtual std::vector<Alert> alerts(const std::string& location) = 0;
    virtual AirQuality air_quality(const std::string& location) = 0;
};

} // namespace weather
