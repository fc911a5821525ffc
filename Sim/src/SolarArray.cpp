#include "SolarArray.hpp"

#include <algorithm>
#include <cmath>

namespace {
constexpr double STC_CELL_TEMP_C = 25.0;

// Non-finite or negative irradiance (sensor gaps, night offsets) is no sun.
double sanitize_irradiance_kw(double irradiance_Wm2) {
    if (!std::isfinite(irradiance_Wm2) || irradiance_Wm2 <= 0.0) return 0.0;
    return irradiance_Wm2 / 1000.0;
}
} // anonymous namespace

/**
 * SolarArray
 *
 * Flat-plate PV array with a linear temperature correction:
 *
 *   G       = irradiance / 1000                    (kW/m²)
 *   T_cell  = T_ambient + noct_coeff * G
 *   d       = max(0, 1 - k_t * (T_cell - 25))
 *   P_out   = capacity * system_derating * G * d
 *
 * capacity is rated at G = 1 kW/m², so P_out is in kW and, for hourly
 * samples, equal to the energy delivered in that hour (kWh).
 */
SolarArray::SolarArray(double capacity_kw, const DispatchParams& params)
    : capacity_kw_(capacity_kw),
      system_derating_(params.pv_system_derating),
      temp_coeff_(params.pv_temp_derating_coeff),
      noct_coeff_(params.pv_noct_coeff) {}

double SolarArray::cellTemperature(double irradiance_Wm2, double ambient_C) const {
    return ambient_C + noct_coeff_ * sanitize_irradiance_kw(irradiance_Wm2);
}

double SolarArray::output(double irradiance_Wm2, double ambient_C) const {
    const double g_kw = sanitize_irradiance_kw(irradiance_Wm2);
    if (g_kw <= 0.0 || capacity_kw_ <= 0.0) return 0.0;

    const double t_cell = ambient_C + noct_coeff_ * g_kw;
    const double derate = std::max(0.0, 1.0 - temp_coeff_ * (t_cell - STC_CELL_TEMP_C));

    const double p = capacity_kw_ * system_derating_ * g_kw * derate;
    return (std::isfinite(p) && p > 0.0) ? p : 0.0;
}
