#include "LoadProfile.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

const DiurnalShape TIER5_LOAD_SHAPE = {
    0.021008403, 0.021008403, 0.021008403, 0.021008403,  // 00-03
    0.027310924, 0.037815126, 0.042016807, 0.042016807,  // 04-07
    0.042016807, 0.042016807, 0.042016807, 0.042016807,  // 08-11
    0.042016807, 0.042016807, 0.042016807, 0.042016807,  // 12-15
    0.046218487, 0.050420168, 0.067226891, 0.084033613,  // 16-19
    0.073529412, 0.052521008, 0.033613445, 0.023109244,  // 20-23
};

std::vector<double> buildLoadProfile(double annual_demand_kwh,
                                     const DiurnalShape& shape) {
    if (!std::isfinite(annual_demand_kwh) || annual_demand_kwh <= 0.0) {
        std::ostringstream oss;
        oss << "buildLoadProfile: annual demand must be > 0 kWh, got "
            << annual_demand_kwh;
        throw std::invalid_argument(oss.str());
    }

    double sum = 0.0;
    for (int h = 0; h < HOURS_PER_DAY; ++h) {
        const double v = shape[h];
        if (!std::isfinite(v) || v < 0.0) {
            std::ostringstream oss;
            oss << "buildLoadProfile: shape value at hour " << h
                << " must be finite and >= 0, got " << v;
            throw std::invalid_argument(oss.str());
        }
        sum += v;
    }
    if (std::fabs(sum - 1.0) > LOAD_SHAPE_SUM_TOLERANCE) {
        std::ostringstream oss;
        oss << "buildLoadProfile: shape must sum to 1.0, sums to " << sum;
        throw std::invalid_argument(oss.str());
    }

    const double daily_kwh = annual_demand_kwh / static_cast<double>(DAYS_PER_YEAR);

    std::vector<double> profile(HOURS_PER_YEAR);
    for (int i = 0; i < HOURS_PER_YEAR; ++i) {
        profile[i] = shape[i % HOURS_PER_DAY] * daily_kwh;
    }
    return profile;
}
