#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "PowerBus.hpp"

// Running totals over the simulated hours. Only ever grows.
struct DispatchAccumulators {
    double pv_kwh                = 0.0;
    double diesel_kwh            = 0.0;
    double battery_discharge_kwh = 0.0;
    double curtailed_kwh         = 0.0;
    double unmet_kwh             = 0.0;
    double fuel_litres           = 0.0;

    int diesel_hours      = 0;
    int unmet_hours       = 0;
    int curtailment_hours = 0;

    double soc_sum      = 0.0;
    double max_dod      = 0.0;
    double battery_wear = 0.0;
    int    hours        = 0;

    void add(const HourOutcome& h);
};

// One year of dispatch for one node. Immutable once built.
class DispatchResult {
public:
    DispatchResult(double pv_capacity_kw,
                   double battery_capacity_kwh,
                   double diesel_capacity_kw,
                   double annual_demand_kwh,
                   const DispatchAccumulators& acc);

    // Inputs
    double pvCapacityKw() const { return pv_capacity_kw_; }
    double batteryCapacityKwh() const { return battery_capacity_kwh_; }
    double dieselCapacityKw() const { return diesel_capacity_kw_; }
    double annualDemandKwh() const { return annual_demand_kwh_; }

    // Totals
    double pvGenerationKwh() const { return pv_generation_kwh_; }
    double dieselGenerationKwh() const { return diesel_generation_kwh_; }
    double batteryDischargeKwh() const { return battery_discharge_kwh_; }
    double curtailmentKwh() const { return curtailment_kwh_; }
    double unmetDemandKwh() const { return unmet_demand_kwh_; }
    double fuelLitres() const { return fuel_litres_; }

    int dieselHours() const { return diesel_hours_; }
    int unmetHours() const { return unmet_hours_; }
    int curtailmentHours() const { return curtailment_hours_; }

    double avgSoc() const { return avg_soc_; }
    double maxDod() const { return max_dod_; }
    double batteryCycles() const { return battery_cycles_; }
    double batteryWear() const { return battery_wear_; }

    // Derived ratios; 0 whenever the denominator is 0.
    double effectivePvCapacityFactor() const;   // pv_gen / (pv_kw * 8760)
    double curtailmentFraction() const;         // curtailed / (pv_gen + curtailed)
    double dieselShare() const;                 // diesel / (pv_gen + diesel)
    double lpsp() const;                        // unmet / annual demand
    double batteryUtilisation() const;          // discharge / (battery_kwh * 365)

    // Ordered name/value columns for reports and the summary CSV.
    std::vector<std::pair<std::string, double>> summary() const;

    // Flat encoding used to move results between MPI ranks.
    static constexpr std::size_t PACKED_SIZE = 18;
    std::vector<double> pack() const;
    static DispatchResult unpack(const double* packed);

    bool operator==(const DispatchResult& o) const;
    bool operator!=(const DispatchResult& o) const { return !(*this == o); }

private:
    DispatchResult() = default;

    double pv_capacity_kw_       = 0.0;
    double battery_capacity_kwh_ = 0.0;
    double diesel_capacity_kw_   = 0.0;
    double annual_demand_kwh_    = 0.0;

    double pv_generation_kwh_     = 0.0;
    double diesel_generation_kwh_ = 0.0;
    double battery_discharge_kwh_ = 0.0;
    double curtailment_kwh_       = 0.0;
    double unmet_demand_kwh_      = 0.0;
    double fuel_litres_           = 0.0;

    int diesel_hours_      = 0;
    int unmet_hours_       = 0;
    int curtailment_hours_ = 0;

    double avg_soc_        = 0.0;
    double max_dod_        = 0.0;
    double battery_cycles_ = 0.0;
    double battery_wear_   = 0.0;
};
