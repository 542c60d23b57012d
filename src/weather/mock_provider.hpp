#pragma once

#include "provider.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace weather {

/**
 * Offline weather source.
 *
 * Known cities come from a fixed table; anything else, as well as forecasts,
 * alerts and air quality, is generated from a seeded random engine so runs
 * are reproducible for a given seed.
 */
class MockProvider final : public Provider {
public:
    static constexpr int kMaxForecastDays = weather::kMaxForecastDays;

    explicit MockProvider(uint32_t seed);

    CurrentConditions current(const std::string& location, Units units) override;
    std::vector<DailyForecast> forecast(const std::string& location, int days, Units units) override;
    std::vector<Alert> alerts(const std::string& location) override;
    AirQuality air_quality(const std::string& location) override;

    /// Table entry for a known city, in metric units and without timestamp.
    static std::optional<CurrentConditions> lookup(const std::string& location);

private:
    std::mt19937 rng_;

    double uniform(double low, double high);
    int uniform_int(int low, int high);
    const std::string& pick(const std::vector<std::string>& choices);
};

} // namespace weather
