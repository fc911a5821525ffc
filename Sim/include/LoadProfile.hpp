#pragma once

#include <array>
#include <vector>

#include "HourContext.hpp"

using DiurnalShape = std::array<double, HOURS_PER_DAY>;

// Tier-5 reference load curve: normalised share of daily demand per hour of
// day (00..23). Sums to 1.0. Evening peak at 19:00.
extern const DiurnalShape TIER5_LOAD_SHAPE;

// Tolerance on sum(shape) == 1.0
constexpr double LOAD_SHAPE_SUM_TOLERANCE = 1e-6;

// Expand an annual energy total into 8760 hourly demand values (kWh),
// profile[h] = shape[h % 24] * annual_demand_kwh / 365.
//
// Throws std::invalid_argument if annual_demand_kwh is not finite and > 0,
// or if the shape has a negative / non-finite entry or does not sum to 1.
std::vector<double> buildLoadProfile(double annual_demand_kwh,
                                     const DiurnalShape& shape = TIER5_LOAD_SHAPE);
