#include "PowerBus.hpp"
#include "DispatchPolicy.hpp"

PowerBus::PowerBus(const SolarArray& solar,
                   Battery& battery,
                   const DieselGenerator& diesel,
                   const DispatchParams& params)
    : solar_(solar), battery_(battery), diesel_(diesel), params_(params) {}

HourOutcome PowerBus::settleHour(const HourContext& ctx,
                                 double demand_kwh,
                                 double irradiance_Wm2,
                                 double ambient_C) {
    HourOutcome out;
    out.hour_index  = ctx.hour_index;
    out.hour_of_day = ctx.hour_of_day;
    out.demand_kwh  = demand_kwh;

    battery_.selfDischarge(ctx);

    out.pv_kwh = solar_.output(irradiance_Wm2, ambient_C);
    const double net_load = demand_kwh - out.pv_kwh;

    if (net_load <= 0.0) {
        // Surplus: load fully served by PV, the rest offered to the battery.
        out.pv_to_load_kwh = demand_kwh;
        const ChargeResult ch = battery_.charge(-net_load);
        out.pv_to_battery_kwh = ch.absorbed_kwh;
        out.curtailed_kwh     = ch.curtailed_kwh;
    } else {
        out.pv_to_load_kwh = out.pv_kwh;

        BatteryView view;
        view.present       = battery_.hasCapacity();
        view.available_kwh = params_.reserve_aware_dispatch
                                 ? battery_.availableDischargeKwh()
                                 : battery_.storedDischargeKwh();
        view.headroom_kwh  = battery_.chargeHeadroomKwh();
        view.charge_eff    = battery_.getChargeEfficiency();

        const double diesel = decideDieselOutput(ctx.hour_of_day, net_load, view,
                                                 diesel_.getCapacityKw(), params_);
        if (diesel > 0.0) {
            out.diesel_kwh  = diesel;
            out.fuel_litres = diesel_.fuelLitres(diesel);
        }

        const double remaining = net_load - diesel;
        if (remaining > 0.0) {
            out.diesel_to_load_kwh = diesel;
            const DischargeResult dis = battery_.discharge(remaining, ctx);
            out.battery_discharge_kwh = dis.delivered_kwh;
            out.unmet_kwh             = dis.unmet_kwh;
        } else {
            // Diesel overshoot (minimum load or evening recharge).
            out.diesel_to_load_kwh = net_load;
            const ChargeResult ch = battery_.charge(-remaining);
            out.diesel_to_battery_kwh = ch.absorbed_kwh;
            out.diesel_spilled_kwh    = ch.curtailed_kwh;
        }
    }

    battery_.closeHour(ctx);
    out.soc = battery_.getSoc();

    if (ctx.isEndOfDay()) {
        out.wear_increment = battery_.endOfDay();
    }

    return out;
}
