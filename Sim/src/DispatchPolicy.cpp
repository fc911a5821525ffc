#include "DispatchPolicy.hpp"

#include <algorithm>

namespace {
// Band edges, in hour of day. Fixed clock hours, not sunrise/sunset.
constexpr int MORNING_EDGE_HOUR = 4;
constexpr int NIGHT_EDGE_HOUR   = 23;
} // anonymous namespace

DispatchBand bandForHour(int hour_of_day, int break_hour) {
    if (hour_of_day > MORNING_EDGE_HOUR && hour_of_day <= break_hour) {
        return DispatchBand::Daytime;
    }
    if (hour_of_day > break_hour && hour_of_day < NIGHT_EDGE_HOUR) {
        return DispatchBand::Evening;
    }
    return DispatchBand::Night;
}

double decideDieselOutput(int hour_of_day,
                          double net_load_kwh,
                          const BatteryView& battery,
                          double diesel_capacity_kw,
                          const DispatchParams& params) {
    if (net_load_kwh <= 0.0 || diesel_capacity_kw <= 0.0) return 0.0;

    const double min_load = params.diesel_min_load_fraction * diesel_capacity_kw;

    // Output that serves the load and fills the battery, within the rating.
    double max_useful = std::min(diesel_capacity_kw, net_load_kwh);
    if (battery.present) {
        max_useful = std::min(diesel_capacity_kw,
                              net_load_kwh + battery.headroom_kwh / battery.charge_eff);
    }

    const bool battery_short = battery.available_kwh < net_load_kwh;

    double diesel = 0.0;
    switch (bandForHour(hour_of_day, params.break_hour)) {
    case DispatchBand::Daytime:
        if (battery_short) {
            diesel = std::min(diesel_capacity_kw, std::max(min_load, net_load_kwh));
        }
        break;
    case DispatchBand::Evening:
        if (max_useful > min_load) {
            diesel = max_useful;
        }
        break;
    case DispatchBand::Night:
        if (battery_short) {
            diesel = std::max(min_load, max_useful);
        }
        break;
    }

    // A running unit cannot idle below its minimum load.
    if (diesel > 0.0 && diesel < min_load) {
        diesel = min_load;
    }
    return diesel;
}
