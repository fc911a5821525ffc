#include "DieselGenerator.hpp"

DieselGenerator::DieselGenerator(double capacity_kw, const DispatchParams& params)
    : capacity_kw_(capacity_kw),
      min_load_fraction_(params.diesel_min_load_fraction),
      idle_coeff_(params.fuel_idle_coeff),
      prop_coeff_(params.fuel_prop_coeff) {}

double DieselGenerator::fuelLitres(double output_kw) const {
    if (output_kw <= 0.0) return 0.0;
    return capacity_kw_ * idle_coeff_ + output_kw * prop_coeff_;
}
