#pragma once

#include "Battery.hpp"
#include "DieselGenerator.hpp"
#include "DispatchParams.hpp"
#include "HourContext.hpp"
#include "SolarArray.hpp"

// Energy flows of one settled hour (kWh unless noted).
struct HourOutcome {
    int    hour_index  = 0;
    int    hour_of_day = 0;

    double demand_kwh = 0.0;

    // PV: pv_to_load + pv_to_battery + curtailed == pv
    double pv_kwh            = 0.0;
    double pv_to_load_kwh    = 0.0;
    double pv_to_battery_kwh = 0.0;
    double curtailed_kwh     = 0.0;

    // Diesel: diesel_to_load + diesel_to_battery + diesel_spilled == diesel
    double diesel_kwh            = 0.0;
    double diesel_to_load_kwh    = 0.0;
    double diesel_to_battery_kwh = 0.0;
    double diesel_spilled_kwh    = 0.0;
    double fuel_litres           = 0.0;

    double battery_discharge_kwh = 0.0;
    double unmet_kwh             = 0.0;

    double soc             = 0.0;   // after the hour closed
    double wear_increment  = 0.0;   // non-zero only at hour 23
};

// Unmet energy below this is float residue; it does not count an unmet hour.
constexpr double UNMET_HOUR_EPS_KWH = 1e-6;

// Settles one hour on the island bus: PV first, then the diesel decision,
// then the battery takes the surplus or covers the remaining deficit.
// Holds no energy between hours; all carried state lives in the Battery.
class PowerBus {
public:
    PowerBus(const SolarArray& solar,
             Battery& battery,
             const DieselGenerator& diesel,
             const DispatchParams& params);

    HourOutcome settleHour(const HourContext& ctx,
                           double demand_kwh,
                           double irradiance_Wm2,
                           double ambient_C);

private:
    const SolarArray&      solar_;
    Battery&               battery_;
    const DieselGenerator& diesel_;
    const DispatchParams&  params_;
};
