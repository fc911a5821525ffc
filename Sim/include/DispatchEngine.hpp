#pragma once

#include <optional>
#include <vector>

#include "ClimateSeries.hpp"
#include "DispatchParams.hpp"
#include "DispatchResult.hpp"
#include "LoadProfile.hpp"
#include "PowerBus.hpp"

// Caller-supplied description of one node-year.
struct SimulationInputs {
    double pv_capacity_kw       = 0.0;
    double battery_capacity_kwh = 0.0;
    double diesel_capacity_kw   = 0.0;
    double annual_demand_kwh    = 0.0;

    // Empty -> TIER5_LOAD_SHAPE
    std::optional<DiurnalShape> load_shape;

    DispatchParams params;

    // Throws std::invalid_argument on negative / non-finite capacities,
    // non-positive demand or an invalid parameter bundle.
    void validate() const;
};

// Simulate hours 0..8759 for one node. Pure: holds no state between calls
// and performs no I/O. If trace is non-null it is cleared and receives one
// HourOutcome per hour.
//
// Throws std::invalid_argument for invalid inputs or climate arrays shorter
// than 8760 hours.
DispatchResult runDispatch(const SimulationInputs& inputs,
                           const ClimateSeries& climate,
                           std::vector<HourOutcome>* trace = nullptr);
