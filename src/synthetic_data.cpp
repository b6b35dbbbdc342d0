#include "synthetic_data.hpp"
#include "data_source.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <random>

namespace ensemble {

namespace {

constexpr int HOURS_PER_DAY = 24;
constexpr double MIN_PRICE_CHANGE = -0.5;  // keep prices positive

// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + static_cast<unsigned>(d) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

std::string formatHour(long long day, int hour) {
    int y, m, d;
    civilFromDays(day, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:00", y, m, d, hour);
    return std::string(buf);
}

} // namespace

std::vector<Bar> generateSyntheticBars(const SyntheticParams& params) {
    std::vector<Bar> bars;
    if (params.days <= 0 || params.regime_period <= 0) return bars;
    auto start = parseTimestamp(params.start_date);
    if (!start) return bars;

    std::mt19937_64 rng(params.seed);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::normal_distribution<double> standard_normal(0.0, 1.0);

    const long long first_day = daysFromCivil(start->year, start->month, start->day);
    const int total = params.days * HOURS_PER_DAY;
    bars.reserve(static_cast<std::size_t>(total));

    double price = params.start_price;
    double vol_multiplier = 1.0;
    double drift = 0.0;
    std::string regime = "normal";

    for (int i = 0; i < total; ++i) {
        const long long day = first_day + i / HOURS_PER_DAY;
        const int hour = i % HOURS_PER_DAY;
        const int weekday = static_cast<int>(((day % 7) + 7 + 3) % 7);  // Monday = 0

        if (i % params.regime_period == 0) {
            double roll = uniform(rng);
            if (roll < 0.3) {
                regime = "high";
                vol_multiplier = 2.5;
            } else if (roll < 0.6) {
                regime = "low";
                vol_multiplier = 0.5;
            } else {
                regime = "normal";
                vol_multiplier = 1.0;
            }
            drift = -params.max_drift + 2.0 * params.max_drift * uniform(rng);
        }

        double time_vol = (hour >= 8 && hour <= 16) ? 1.5 : 1.0;
        if (weekday >= 5) time_vol *= 0.7;

        const double vol = params.base_volatility * vol_multiplier * time_vol;
        double change = drift + vol * standard_normal(rng);

        if (uniform(rng) < params.spike_probability) {
            double magnitude = params.spike_min + (params.spike_max - params.spike_min) * uniform(rng);
            change += uniform(rng) > 0.5 ? magnitude : -magnitude;
        }
        price *= 1.0 + std::max(change, MIN_PRICE_CHANGE);

        const double open = price;
        const double high = open * (1.0 + std::abs(vol * 0.5 * standard_normal(rng)));
        const double low = open * (1.0 - std::abs(vol * 0.5 * standard_normal(rng)));
        const double volume_mu = 15.0 + 0.5 * standard_normal(rng);

        Bar b;
        b.timestamp = formatHour(day, hour);
        b.open = open;
        b.close = price;
        b.high = std::max({ open, high, b.close });
        b.low = std::min({ open, low, b.close });
        b.volume = std::exp(volume_mu + standard_normal(rng));
        b.regime = regime;
        bars.push_back(b);
    }
    return bars;
}

} // namespace ensemble
