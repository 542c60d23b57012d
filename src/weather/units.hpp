#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace weather {

// Source data is Celsius and km/h; other systems are converted on the way out.
enum class Units {
    Metric,   // C, km/h
    Imperial, // F, mph
    Standard, // K, m/s
};

NLOHMANN_JSON_SERIALIZE_ENUM(Units, {
    {Units::Metric, "metric"},
    {Units::Imperial, "imperial"},
    {Units::Standard, "standard"},
})

std::optional<Units> parse_units(const std::string& name);
const char* units_name(Units units);
const char* temperature_unit(Units units);
const char* wind_unit(Units units);

double convert_temperature(double celsius, Units units);
double convert_wind_speed(double kmh, Units units);

} // namespace weather
