#include "report.hpp"

#include <iomanip>
#include <sstream>

namespace weather {

namespace {

const std::string kRule(50, '-');

} // namespace

std::string format_current(const CurrentConditions& conditions) {
    const char* temp = temperature_unit(conditions.units);

    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "Weather in " << conditions.location << "\n";
    out << kRule << "\n";
    out << "Condition:   " << conditions.condition << " (" << conditions.description << ")\n";
    out << "Temperature: " << conditions.temperature << temp << " (feels like " << conditions.feels_like << temp
        << ")\n";
    out << "Humidity:    " << conditions.humidity << "%\n";
    out << "Wind:        " << conditions.wind_speed << " " << wind_unit(conditions.units) << "\n";
    out << "Observed:    " << conditions.timestamp << "\n";
    return out.str();
}

std::string format_forecast(const std::string& location, const std::vector<DailyForecast>& days, Units units) {
    const char* temp = temperature_unit(units);

    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << days.size() << "-Day Forecast for " << location << ":\n";
    out << kRule << "\n";
    for (const auto& day : days) {
        out << day.date << ": " << day.condition << "\n";
        out << "  Temp: " << day.temp_max << temp << " / " << day.temp_min << temp << "\n";
        out << "  Wind: " << day.wind_speed << " " << wind_unit(units) << "\n";
        out << "\n";
    }
    return out.str();
}

std::string format_alerts(const std::string& location, const std::vector<Alert>& alerts) {
    std::ostringstream out;
    if (alerts.empty()) {
        out << "No active weather alerts for " << location << "\n";
        return out.str();
    }

    out << "Weather alerts for " << location << ":\n";
    out << kRule << "\n";
    for (const auto& alert : alerts) {
        out << "[" << alert.severity << "] " << alert.title << "\n";
        out << "  " << alert.description << "\n";
        out << "  From " << alert.effective_from << " until " << alert.expires << "\n";
    }
    return out.str();
}

std::string format_air_quality(const AirQuality& quality) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "Air Quality for " << quality.location << ":\n";
    out << kRule << "\n";
    out << "AQI: " << quality.aqi << " - " << quality.quality << "\n";
    out << "PM2.5: " << quality.pm25 << " ug/m3\n";
    out << "PM10: " << quality.pm10 << " ug/m3\n";
    return out.str();
}

} // namespace weather
