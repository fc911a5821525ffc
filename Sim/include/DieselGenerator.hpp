#pragma once

#include "DispatchParams.hpp"

class DieselGenerator {
public:
    DieselGenerator(double capacity_kw, const DispatchParams& params);

    // Lowest output at which the unit may run (kW).
    double minimumLoadKw() const { return capacity_kw_ * min_load_fraction_; }

    // Two-part fuel curve for one dispatched hour (litres):
    //   capacity * idle_coeff + output * proportional_coeff
    // Returns 0 when output_kw <= 0; an idle unit burns nothing.
    double fuelLitres(double output_kw) const;

    double getCapacityKw() const { return capacity_kw_; }

private:
    double capacity_kw_;
    double min_load_fraction_;
    double idle_coeff_;   // l/h per kW installed
    double prop_coeff_;   // l/kWh
};
