#include "DispatchResult.hpp"

#include <algorithm>
#include <cmath>

namespace {

double ratio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

double round_to(double v, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(v * scale) / scale;
}

} // anonymous namespace

void DispatchAccumulators::add(const HourOutcome& h) {
    pv_kwh                += h.pv_kwh;
    diesel_kwh            += h.diesel_kwh;
    battery_discharge_kwh += h.battery_discharge_kwh;
    curtailed_kwh         += h.curtailed_kwh;
    unmet_kwh             += h.unmet_kwh;
    fuel_litres           += h.fuel_litres;

    if (h.diesel_kwh > 0.0)                 ++diesel_hours;
    if (h.unmet_kwh > UNMET_HOUR_EPS_KWH)   ++unmet_hours;
    if (h.curtailed_kwh > 0.0)              ++curtailment_hours;

    soc_sum      += h.soc;
    max_dod       = std::max(max_dod, 1.0 - h.soc);
    battery_wear += h.wear_increment;
    ++hours;
}

DispatchResult::DispatchResult(double pv_capacity_kw,
                               double battery_capacity_kwh,
                               double diesel_capacity_kw,
                               double annual_demand_kwh,
                               const DispatchAccumulators& acc)
    : pv_capacity_kw_(pv_capacity_kw),
      battery_capacity_kwh_(battery_capacity_kwh),
      diesel_capacity_kw_(diesel_capacity_kw),
      annual_demand_kwh_(annual_demand_kwh),
      pv_generation_kwh_(acc.pv_kwh),
      diesel_generation_kwh_(acc.diesel_kwh),
      battery_discharge_kwh_(acc.battery_discharge_kwh),
      curtailment_kwh_(acc.curtailed_kwh),
      unmet_demand_kwh_(acc.unmet_kwh),
      fuel_litres_(acc.fuel_litres),
      diesel_hours_(acc.diesel_hours),
      unmet_hours_(acc.unmet_hours),
      curtailment_hours_(acc.curtailment_hours),
      avg_soc_(acc.hours > 0 ? acc.soc_sum / acc.hours : 0.0),
      max_dod_(acc.max_dod),
      battery_cycles_(ratio(acc.battery_discharge_kwh, battery_capacity_kwh)),
      battery_wear_(acc.battery_wear) {}

double DispatchResult::effectivePvCapacityFactor() const {
    return ratio(pv_generation_kwh_, pv_capacity_kw_ * HOURS_PER_YEAR);
}

double DispatchResult::curtailmentFraction() const {
    return ratio(curtailment_kwh_, pv_generation_kwh_ + curtailment_kwh_);
}

double DispatchResult::dieselShare() const {
    return ratio(diesel_generation_kwh_, pv_generation_kwh_ + diesel_generation_kwh_);
}

double DispatchResult::lpsp() const {
    return ratio(unmet_demand_kwh_, annual_demand_kwh_);
}

double DispatchResult::batteryUtilisation() const {
    return ratio(battery_discharge_kwh_, battery_capacity_kwh_ * DAYS_PER_YEAR);
}

std::vector<std::pair<std::string, double>> DispatchResult::summary() const {
    return {
        {"pv_kw",           pv_capacity_kw_},
        {"battery_kwh",     battery_capacity_kwh_},
        {"diesel_kw",       diesel_capacity_kw_},
        {"demand_kwh",      annual_demand_kwh_},
        {"pv_gen_kwh",      round_to(pv_generation_kwh_, 1)},
        {"diesel_gen_kwh",  round_to(diesel_generation_kwh_, 1)},
        {"curtailment_kwh", round_to(curtailment_kwh_, 1)},
        {"unmet_kwh",       round_to(unmet_demand_kwh_, 1)},
        {"fuel_litres",     round_to(fuel_litres_, 1)},
        {"effective_cf",    round_to(effectivePvCapacityFactor(), 4)},
        {"curtailment_pct", round_to(curtailmentFraction(), 4)},
        {"diesel_share",    round_to(dieselShare(), 4)},
        {"lpsp",            round_to(lpsp(), 4)},
        {"diesel_hours",    static_cast<double>(diesel_hours_)},
        {"unmet_hours",     static_cast<double>(unmet_hours_)},
        {"battery_cycles",  round_to(battery_cycles_, 1)},
        {"avg_soc",         round_to(avg_soc_, 4)},
        {"battery_wear",    round_to(battery_wear_, 4)},
    };
}

std::vector<double> DispatchResult::pack() const {
    return {
        pv_capacity_kw_, battery_capacity_kwh_, diesel_capacity_kw_, annual_demand_kwh_,
        pv_generation_kwh_, diesel_generation_kwh_, battery_discharge_kwh_,
        curtailment_kwh_, unmet_demand_kwh_, fuel_litres_,
        static_cast<double>(diesel_hours_),
        static_cast<double>(unmet_hours_),
        static_cast<double>(curtailment_hours_),
        avg_soc_, max_dod_, battery_cycles_, battery_wear_,
        1.0,  // presence marker: a zeroed slot unpacks as "not run"
    };
}

DispatchResult DispatchResult::unpack(const double* p) {
    DispatchResult r;
    r.pv_capacity_kw_        = p[0];
    r.battery_capacity_kwh_  = p[1];
    r.diesel_capacity_kw_    = p[2];
    r.annual_demand_kwh_     = p[3];
    r.pv_generation_kwh_     = p[4];
    r.diesel_generation_kwh_ = p[5];
    r.battery_discharge_kwh_ = p[6];
    r.curtailment_kwh_       = p[7];
    r.unmet_demand_kwh_      = p[8];
    r.fuel_litres_           = p[9];
    r.diesel_hours_          = static_cast<int>(std::lround(p[10]));
    r.unmet_hours_           = static_cast<int>(std::lround(p[11]));
    r.curtailment_hours_     = static_cast<int>(std::lround(p[12]));
    r.avg_soc_               = p[13];
    r.max_dod_               = p[14];
    r.battery_cycles_        = p[15];
    r.battery_wear_          = p[16];
    return r;
}

bool DispatchResult::operator==(const DispatchResult& o) const {
    return pack() == o.pack();
}
