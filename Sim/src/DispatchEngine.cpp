#include "DispatchEngine.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "Battery.hpp"
#include "DieselGenerator.hpp"
#include "SolarArray.hpp"

namespace {

void require_capacity(double v, const char* name) {
    if (!std::isfinite(v) || v < 0.0) {
        std::ostringstream oss;
        oss << "SimulationInputs: " << name << " must be finite and >= 0, got " << v;
        throw std::invalid_argument(oss.str());
    }
}

} // anonymous namespace

void SimulationInputs::validate() const {
    require_capacity(pv_capacity_kw, "pv_capacity_kw");
    require_capacity(battery_capacity_kwh, "battery_capacity_kwh");
    require_capacity(diesel_capacity_kw, "diesel_capacity_kw");
    if (!std::isfinite(annual_demand_kwh) || annual_demand_kwh <= 0.0) {
        std::ostringstream oss;
        oss << "SimulationInputs: annual_demand_kwh must be > 0, got " << annual_demand_kwh;
        throw std::invalid_argument(oss.str());
    }
    params.validate();
}

DispatchResult runDispatch(const SimulationInputs& inputs,
                           const ClimateSeries& climate,
                           std::vector<HourOutcome>* trace) {
    inputs.validate();
    climate.validate();

    const std::vector<double> load =
        buildLoadProfile(inputs.annual_demand_kwh,
                         inputs.load_shape ? *inputs.load_shape : TIER5_LOAD_SHAPE);

    const DispatchParams& params = inputs.params;

    SolarArray      solar(inputs.pv_capacity_kw, params);
    Battery         battery(inputs.battery_capacity_kwh, params);
    DieselGenerator diesel(inputs.diesel_capacity_kw, params);
    PowerBus        bus(solar, battery, diesel, params);

    if (trace) {
        trace->clear();
        trace->reserve(HOURS_PER_YEAR);
    }

    DispatchAccumulators acc;
    for (int i = 0; i < HOURS_PER_YEAR; ++i) {
        const HourContext ctx = HourContext::at(i);
        const HourOutcome hour = bus.settleHour(ctx, load[i],
                                                climate.irradiance_Wm2[i],
                                                climate.ambient_C[i]);
        acc.add(hour);
        if (trace) trace->push_back(hour);
    }

    return DispatchResult(inputs.pv_capacity_kw,
                          inputs.battery_capacity_kwh,
                          inputs.diesel_capacity_kw,
                          inputs.annual_demand_kwh,
                          acc);
}
