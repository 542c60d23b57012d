#pragma once

#include "provider.hpp"

#include <string>
#include <vector>

namespace weather {

std::string format_current(const CurrentConditions& conditions);
std::string format_forecast(const std::string& location, const std::vector<DailyForecast>& days, Units units);
std::string format_alerts(const std::string& location, const std::vector<Alert>& alerts);
std::string format_air_quality(const AirQuality& quality);

} // namespace weather
