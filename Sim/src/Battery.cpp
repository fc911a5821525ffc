#include "Battery.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
// Smallest scaled DoD fed to the cycle-life curve (the curve diverges at 0).
constexpr double MIN_WEAR_DOD = 0.1;
} // anonymous namespace

double cycleWear(double soc_swing, double scaled_dod, double coeff_a, double coeff_b) {
    const double cycles_to_failure = coeff_a * std::pow(std::max(MIN_WEAR_DOD, scaled_dod), coeff_b);
    if (!(cycles_to_failure > 0.0)) return 0.0;
    return soc_swing / cycles_to_failure;
}

Battery::Battery(double capacity_kwh, const DispatchParams& params)
    : capacity_kwh_(capacity_kwh),
      soc_(params.battery_initial_soc),
      floor_soc_(1.0 - params.battery_dod_max),
      dod_max_(params.battery_dod_max),
      charge_eff_(params.battery_charge_eff),
      discharge_eff_(params.battery_discharge_eff),
      self_discharge_(params.battery_self_discharge),
      cycle_a_(params.cycle_life_coeff_a),
      cycle_b_(params.cycle_life_coeff_b) {
    clamp_();
}

void Battery::clamp_() {
    soc_ = std::clamp(soc_, 0.0, 1.0);
}

void Battery::selfDischarge(const HourContext& ctx) {
    // Overwrites the slot: the hour's swing starts with the leakage.
    daily_use_[ctx.hour_of_day] = self_discharge_ * soc_;
    soc_ *= (1.0 - self_discharge_);
    clamp_();
}

//
// Charge losses are taken on the way in: absorbing E from the bus raises the
// stored energy by charge_eff * E.
//
ChargeResult Battery::charge(double requested_kwh) {
    ChargeResult r;
    if (requested_kwh <= 0.0) return r;

    if (!hasCapacity()) {
        r.curtailed_kwh = requested_kwh;
        return r;
    }

    const double absorbable = chargeHeadroomKwh() / charge_eff_;
    r.absorbed_kwh  = std::min(requested_kwh, absorbable);
    r.curtailed_kwh = requested_kwh - r.absorbed_kwh;

    soc_ += charge_eff_ * r.absorbed_kwh / capacity_kwh_;
    clamp_();
    return r;
}

//
// Discharge losses are taken on the way out: delivering E drops the stored
// energy by E / discharge_eff. SOC never goes below floor_soc_.
//
DischargeResult Battery::discharge(double requested_kwh, const HourContext& ctx) {
    DischargeResult r;
    if (requested_kwh <= 0.0) return r;

    if (!hasCapacity()) {
        r.unmet_kwh = requested_kwh;
        return r;
    }

    r.delivered_kwh = std::min(requested_kwh, availableDischargeKwh());
    r.unmet_kwh     = requested_kwh - r.delivered_kwh;

    // A battery that starts below the floor delivers nothing and stays put.
    const double lowest = std::min(soc_, floor_soc_);

    const double drawn = r.delivered_kwh / (discharge_eff_ * capacity_kwh_);
    soc_ -= drawn;
    daily_use_[ctx.hour_of_day] += drawn;

    // Rounding past the floor: give the energy back as unmet, not as SOC.
    if (soc_ < lowest) {
        const double overdraw = lowest - soc_;
        const double overdraw_kwh = overdraw * discharge_eff_ * capacity_kwh_;
        r.delivered_kwh = std::max(0.0, r.delivered_kwh - overdraw_kwh);
        r.unmet_kwh    += overdraw_kwh;
        daily_use_[ctx.hour_of_day] -= overdraw;
        soc_ = lowest;
    }

    clamp_();
    return r;
}

void Battery::closeHour(const HourContext& ctx) {
    clamp_();
    daily_dod_[ctx.hour_of_day] = 1.0 - soc_;
}

double Battery::endOfDay() {
    double increment = 0.0;

    const double max_dod = *std::max_element(daily_dod_.begin(), daily_dod_.end());
    if (hasCapacity() && max_dod > 0.0) {
        const double swing = std::accumulate(daily_use_.begin(), daily_use_.end(), 0.0);
        increment = cycleWear(swing, max_dod * dod_max_, cycle_a_, cycle_b_);
        wear_ += increment;
    }

    daily_use_.fill(0.0);
    daily_dod_.fill(0.0);
    return increment;
}

double Battery::availableDischargeKwh() const {
    if (!hasCapacity()) return 0.0;
    return std::max(0.0, soc_ - floor_soc_) * capacity_kwh_ * discharge_eff_;
}

double Battery::storedDischargeKwh() const {
    if (!hasCapacity()) return 0.0;
    return soc_ * capacity_kwh_ * discharge_eff_;
}

double Battery::chargeHeadroomKwh() const {
    if (!hasCapacity()) return 0.0;
    return (1.0 - soc_) * capacity_kwh_;
}
