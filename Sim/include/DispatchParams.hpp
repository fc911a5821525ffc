#pragma once

#include <string>

// Parameter bundle for one dispatch year. Defaults are the reference
// electrification-planning values (LFP battery, tier-5 load, break hour 17).
struct DispatchParams {
    // PV
    double pv_temp_derating_coeff   = 0.005;   // 1/°C above 25 °C cell temperature
    double pv_noct_coeff            = 25.6;    // °C cell rise per kW/m²
    double pv_system_derating       = 0.90;    // dust, mismatch, wiring

    // Battery
    double battery_dod_max          = 0.80;    // usable fraction of nameplate
    double battery_charge_eff       = 0.938;   // one-way (sqrt of 0.88 round trip)
    double battery_discharge_eff    = 0.938;
    double battery_self_discharge   = 0.0002;  // fraction of SOC lost per hour
    double battery_initial_soc      = 0.50;
    double cycle_life_coeff_a       = 531.52764;
    double cycle_life_coeff_b       = -1.12297;

    // Diesel
    double diesel_min_load_fraction = 0.40;    // of rated capacity
    double fuel_idle_coeff          = 0.08145; // l/h per kW installed
    double fuel_prop_coeff          = 0.246;   // l/kWh generated

    // Strategy
    int    break_hour               = 17;

    // "Battery can cover it" check of the day and night bands. false (the
    // reference methodology) compares against SOC * capacity * discharge
    // efficiency over the whole nameplate; true only counts energy above the
    // depth-of-discharge floor.
    bool   reserve_aware_dispatch   = false;

    // Throws std::invalid_argument naming the first out-of-range field.
    void validate() const;
};

// Override fields of `params` from a parameter CSV with the header
// Category,Parameter,Value[,Low,High]. Only the Dispatch and Solar
// categories are read; unknown rows are skipped. Returns the number of
// fields that were overridden. Throws std::runtime_error if the file cannot
// be opened or a recognised row carries a non-numeric value.
int loadParameterCsv(const std::string& path, DispatchParams& params);
