#include "mock_provider.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace weather {

namespace {

struct KnownLocation {
    const char* key;
    const char* location;
    double temperature;
    double feels_like;
    int humidity;
    double wind_speed;
    const char* condition;
    const char* description;
};

const KnownLocation kKnownLocations[] = {
    {"london", "London, UK", 12.5, 11.2, 72, 15.3, "Partly Cloudy", "Partly cloudy skies with occasional sun"},
    {"newyork", "New York, USA", 5.2, 2.8, 65, 18.5, "Cold & Clear", "Clear skies with cold temperatures"},
    {"tokyo", "Tokyo, Japan", 8.3, 6.5, 58, 12.1, "Overcast", "Overcast conditions throughout the day"},
    {"sydney", "Sydney, Australia", 26.7, 25.1, 60, 8.5, "Sunny", "Sunny and warm with light breeze"},
    {"dunedinfl", "Dunedin, FL USA", 21.1, 20.5, 65, 12.9, "Sunny", "Sunny skies with pleasant weather"},
    {"washingtondc", "Washington DC, USA", 9.4, 8.0, 60, 14.5, "Partly Cloudy", "Mix of clouds and sun"},
    {"losangeles", "Los Angeles, CA USA", 20.0, 19.5, 55, 10.2, "Sunny", "Clear sunny skies"},
    {"miami", "Miami, FL USA", 24.4, 23.8, 70, 11.3, "Mostly Sunny", "Warm and pleasant weather"},
};

const std::vector<std::string> kCurrentConditions = {"Sunny", "Cloudy", "Rainy", "Overcast", "Partly Cloudy"};
const std::vector<std::string> kForecastConditions = {"Sunny", "Cloudy", "Rainy", "Partly Cloudy"};
const std::vector<std::string> kSeverities = {"Low", "Medium", "High"};
const std::vector<std::string> kAirQualityLabels = {"Good", "Moderate", "Unhealthy for Sensitive Groups", "Unhealthy"};

// "Washington DC", "washington, dc" and "WashingtonDC" share one key.
std::string location_key(const std::string& location) {
    std::string key;
    key.reserve(location.size());
    for (unsigned char c : location) {
        if (std::isspace(c) || c == ',') {
            continue;
        }
        key.push_back(static_cast<char>(std::tolower(c)));
    }
    return key;
}

std::string format_utc(std::chrono::system_clock::time_point when, const char* format) {
    std::time_t tt = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), format, &tm);
    return buffer;
}

std::string now_iso() {
    return format_utc(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%SZ");
}

std::string iso_in_hours(int hours) {
    return format_utc(std::chrono::system_clock::now() + std::chrono::hours(hours), "%Y-%m-%dT%H:%M:%SZ");
}

std::string date_in_days(int days) {
    return format_utc(std::chrono::system_clock::now() + std::chrono::hours(24 * days), "%Y-%m-%d");
}

} // namespace

MockProvider::MockProvider(uint32_t seed)
    : rng_(seed) {}

std::optional<CurrentConditions> MockProvider::lookup(const std::string& location) {
    const std::string key = location_key(location);
    for (const auto& known : kKnownLocations) {
        if (key == known.key) {
            CurrentConditions conditions;
            conditions.location = known.location;
            conditions.temperature = known.temperature;
            conditions.feels_like = known.feels_like;
            conditions.humidity = known.humidity;
            conditions.wind_speed = known.wind_speed;
            conditions.condition = known.condition;
            conditions.description = known.description;
            return conditions;
        }
    }
    return std::nullopt;
}

CurrentConditions MockProvider::current(const std::string& location, Units units) {
    if (location.empty()) {
        throw std::invalid_argument("Location must not be empty");
    }

    CurrentConditions conditions;
    if (auto known = lookup(location)) {
        conditions = *known;
    } else {
        double base_temp = uniform(10.0, 28.0);
        conditions.location = location;
        conditions.temperature = base_temp;
        conditions.feels_like = base_temp - uniform(0.5, 2.0);
        conditions.humidity = uniform_int(50, 85);
        conditions.wind_speed = uniform(5.0, 20.0);
        conditions.condition = pick(kCurrentConditions);
        conditions.description = "Weather conditions for the location";
    }

    conditions.temperature = convert_temperature(conditions.temperature, units);
    conditions.feels_like = convert_temperature(conditions.feels_like, units);
    conditions.wind_speed = convert_wind_speed(conditions.wind_speed, units);
    conditions.units = units;
    conditions.timestamp = now_iso();
    return conditions;
}

std::vector<DailyForecast> MockProvider::forecast(const std::string& location, int days, Units units) {
    if (days < 1 || days > kMaxForecastDays) {
        throw std::invalid_argument("days must be between 1 and " + std::to_string(kMaxForecastDays));
    }

    // Derived from current conditions so the forecast uses the same units and magnitudes.
    CurrentConditions base = current(location, units);

    std::vector<DailyForecast> result;
    result.reserve(static_cast<size_t>(days));
    for (int i = 0; i < days; ++i) {
        DailyForecast day;
        day.date = date_in_days(i);
        day.temp_max = base.temperature + uniform(-3.0, 5.0);
        day.temp_min = base.temperature - uniform(2.0, 8.0);
        day.condition = pick(kForecastConditions);
        day.precipitation = uniform(0.0, 30.0);
        day.wind_speed = std::max(0.0, base.wind_speed + uniform(-3.0, 7.0));
        result.push_back(std::move(day));
    }
    return result;
}

std::vector<Alert> MockProvider::alerts(const std::string& location) {
    std::vector<Alert> result;
    if (uniform(0.0, 1.0) <= 0.7) {
        return result;
    }

    Alert alert;
    alert.severity = pick(kSeverities);
    std::string lower_severity = alert.severity;
    std::transform(lower_severity.begin(), lower_severity.end(), lower_severity.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    alert.title = "Weather Alert for " + location;
    alert.description = "A " + lower_severity + " severity weather alert is in effect.";
    alert.effective_from = now_iso();
    alert.expires = iso_in_hours(6);
    result.push_back(std::move(alert));
    return result;
}

AirQuality MockProvider::air_quality(const std::string& location) {
    AirQuality quality;
    quality.location = location;
    quality.aqi = uniform_int(20, 150);
    quality.pm25 = uniform(5.0, 100.0);
    quality.pm10 = uniform(10.0, 150.0);
    quality.no2 = uniform(5.0, 50.0);
    quality.so2 = uniform(2.0, 30.0);
    quality.o3 = uniform(20.0, 150.0);
    quality.quality = pick(kAirQualityLabels);
    quality.timestamp = now_iso();
    return quality;
}

double MockProvider::uniform(double low, double high) {
    std::uniform_real_distribution<double> dist(low, high);
    return dist(rng_);
}

int MockProvider::uniform_int(int low, int high) {
    std::uniform_int_distribution<int> dist(low, high);
    return dist(rng_);
}

const std::string& MockProvider::pick(const std::vector<std::string>& choices) {
    std::uniform_int_distribution<size_t> dist(0, choices.size() - 1);
    return choices[dist(rng_)];
}

} // namespace weather
