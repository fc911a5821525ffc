#pragma once

#include "DispatchParams.hpp"

// Hour-of-day band the diesel decision is keyed on (B = break hour).
enum class DispatchBand {
    Daytime,   // 4 < h <= B  : battery first, diesel only if it cannot cover
    Evening,   // B < h < 23  : diesel serves load and recharges the battery
    Night      // otherwise   : diesel only if the battery cannot cover
};

DispatchBand bandForHour(int hour_of_day, int break_hour);

// What the policy may know about the battery at decision time (kWh).
struct BatteryView {
    double available_kwh = 0.0;   // energy the battery could deliver now
    double headroom_kwh  = 0.0;   // stored-energy room below full
    double charge_eff    = 1.0;
    bool   present       = false; // capacity > 0
};

// Diesel set-point (kW) for one deficit hour (net_load_kwh > 0).
// Pure: no state, no side effects. The result is either 0 or at least the
// minimum load, and never above diesel_capacity_kw.
double decideDieselOutput(int hour_of_day,
                          double net_load_kwh,
                          const BatteryView& battery,
                          double diesel_capacity_kw,
                          const DispatchParams& params);
