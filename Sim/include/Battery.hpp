#pragma once

#include <array>

#include "DispatchParams.hpp"
#include "HourContext.hpp"

// Energy moved by one charge request (kWh).
struct ChargeResult {
    double absorbed_kwh  = 0.0;   // taken from the bus (before charge losses)
    double curtailed_kwh = 0.0;   // offered but not absorbable
};

// Energy moved by one discharge request (kWh).
struct DischargeResult {
    double delivered_kwh = 0.0;   // delivered to the bus (after losses)
    double unmet_kwh     = 0.0;   // requested but not deliverable
};

class Battery {
public:
    Battery(double capacity_kwh, const DispatchParams& params);

    // Hourly self-discharge, applied before any other operation of the hour.
    void selfDischarge(const HourContext& ctx);

    // Absorb up to requested_kwh from the bus, limited by the charge headroom.
    ChargeResult charge(double requested_kwh);

    // Deliver up to requested_kwh, never below the depth-of-discharge floor.
    DischargeResult discharge(double requested_kwh, const HourContext& ctx);

    // Clamp SOC and record the hour's depth of discharge for wear tracking.
    void closeHour(const HourContext& ctx);

    // Cycle wear of the finished day; resets the daily buffers.
    // Returns the increment added to getWear().
    double endOfDay();

    // Deliverable energy above the DoD floor (kWh, after discharge losses).
    double availableDischargeKwh() const;
    // SOC * capacity * discharge efficiency, ignoring the DoD floor.
    double storedDischargeKwh() const;
    // Stored-energy room below full (kWh, before charge losses).
    double chargeHeadroomKwh() const;

    double getSoc() const { return soc_; }
    double getDepthOfDischarge() const { return 1.0 - soc_; }
    double getFloorSoc() const { return floor_soc_; }
    double getCapacityKwh() const { return capacity_kwh_; }
    double getChargeEfficiency() const { return charge_eff_; }
    double getWear() const { return wear_; }
    bool   hasCapacity() const { return capacity_kwh_ > 0.0; }

private:
    void clamp_();

    double capacity_kwh_;
    double soc_;             // fraction of nameplate, kept in [0, 1]
    double floor_soc_;       // 1 - DoD ceiling
    double dod_max_;
    double charge_eff_;
    double discharge_eff_;
    double self_discharge_;  // per hour
    double cycle_a_;
    double cycle_b_;

    // Per hour of the current day: SOC fraction drawn, and DoD at hour end.
    std::array<double, HOURS_PER_DAY> daily_use_{};
    std::array<double, HOURS_PER_DAY> daily_dod_{};

    double wear_ = 0.0;      // equivalent cycle-life fraction consumed
};

// Power-law cycle-life wear of one day: soc_swing / (a * max(0.1, dod)^b),
// where dod is the day's maximum DoD scaled by the DoD ceiling.
double cycleWear(double soc_swing, double scaled_dod, double coeff_a, double coeff_b);
