#include "units.hpp"

#include <algorithm>
#include <cctype>

namespace weather {

std::optional<Units> parse_units(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "metric") return Units::Metric;
    if (lower == "imperial") return Units::Imperial;
    if (lower == "standard") return Units::Standard;
    return std::nullopt;
}

const char* units_name(Units units) {
    switch (units) {
        case Units::Imperial:
            return "imperial";
        case Units::Standard:
            return "standard";
        case Units::Metric:
        default:
            return "metric";
    }
}

const char* temperature_unit(Units units) {
    switch (units) {
        case Units::Imperial:
            return "F";
        case Units::Standard:
            return "K";
        case Units::Metric:
        default:
            return "C";
    }
}

const char* wind_unit(Units units) {
    switch (units) {
        case Units::Imperial:
            return "mph";
        case Units::Standard:
            return "m/s";
        case Units::Metric:
        default:
            return "km/h";
    }
}

double convert_temperature(double celsius, Units units) {
    switch (units) {
        case Units::Imperial:
            return celsius * 9.0 / 5.0 + 32.0;
        case Units::Standard:
            return celsius + 273.15;
        case Units::Metric:
        default:
            return celsius;
    }
}

double convert_wind_speed(double kmh, Units units) {
    switch (units) {
        case Units::Imperial:
            return kmh * 0.621371;
        case Units::Standard:
            return kmh / 3.6;
        case Units::Metric:
        default:
            return kmh;
    }
}

} // namespace weather
