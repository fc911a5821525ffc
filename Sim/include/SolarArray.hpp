#pragma once

#include "DispatchParams.hpp"

class SolarArray {
public:
    // capacity_kw - installed DC nameplate (kW at 1 kW/m², 25 °C)
    SolarArray(double capacity_kw, const DispatchParams& params);

    // Electrical output (kW, equal to kWh over one hour) for one climate
    // sample. Never negative; zero when irradiance is zero.
    double output(double irradiance_Wm2, double ambient_C) const;

    // Cell temperature used by output(), exposed for diagnostics.
    double cellTemperature(double irradiance_Wm2, double ambient_C) const;

    double getCapacityKw() const { return capacity_kw_; }

private:
    double capacity_kw_;
    double system_derating_;   // lumped balance-of-system factor
    double temp_coeff_;        // power loss per °C above 25 °C
    double noct_coeff_;        // °C cell rise per kW/m²
};
