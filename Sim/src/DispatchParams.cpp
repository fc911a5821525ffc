#include "DispatchParams.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void require(bool ok, const char* field, const char* rule) {
    if (!ok) {
        throw std::invalid_argument(
            std::string("DispatchParams: ") + field + " must be " + rule);
    }
}

bool in_unit_open_closed(double v) {
    return std::isfinite(v) && v > 0.0 && v <= 1.0;
}

std::string trim(const std::string& s) {
    const auto a = s.find_first_not_of(" \t\r\n\"");
    const auto b = s.find_last_not_of(" \t\r\n\"");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) cells.push_back(trim(cell));
    return cells;
}

} // anonymous namespace

void DispatchParams::validate() const {
    require(std::isfinite(pv_temp_derating_coeff) && pv_temp_derating_coeff >= 0.0,
            "pv_temp_derating_coeff", "finite and >= 0");
    require(std::isfinite(pv_noct_coeff) && pv_noct_coeff >= 0.0,
            "pv_noct_coeff", "finite and >= 0");
    require(std::isfinite(pv_system_derating) && pv_system_derating >= 0.0 &&
            pv_system_derating <= 1.0,
            "pv_system_derating", "in [0, 1]");

    require(in_unit_open_closed(battery_dod_max), "battery_dod_max", "in (0, 1]");
    require(in_unit_open_closed(battery_charge_eff), "battery_charge_eff", "in (0, 1]");
    require(in_unit_open_closed(battery_discharge_eff), "battery_discharge_eff", "in (0, 1]");
    require(std::isfinite(battery_self_discharge) && battery_self_discharge >= 0.0 &&
            battery_self_discharge < 1.0,
            "battery_self_discharge", "in [0, 1)");
    require(std::isfinite(battery_initial_soc) && battery_initial_soc >= 0.0 &&
            battery_initial_soc <= 1.0,
            "battery_initial_soc", "in [0, 1]");
    require(std::isfinite(cycle_life_coeff_a) && cycle_life_coeff_a > 0.0,
            "cycle_life_coeff_a", "finite and > 0");
    require(std::isfinite(cycle_life_coeff_b), "cycle_life_coeff_b", "finite");

    require(std::isfinite(diesel_min_load_fraction) && diesel_min_load_fraction >= 0.0 &&
            diesel_min_load_fraction <= 1.0,
            "diesel_min_load_fraction", "in [0, 1]");
    require(std::isfinite(fuel_idle_coeff) && fuel_idle_coeff >= 0.0,
            "fuel_idle_coeff", "finite and >= 0");
    require(std::isfinite(fuel_prop_coeff) && fuel_prop_coeff >= 0.0,
            "fuel_prop_coeff", "finite and >= 0");

    require(break_hour >= 4 && break_hour <= 22, "break_hour", "in [4, 22]");
}

int loadParameterCsv(const std::string& path, DispatchParams& params) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open parameter file " + path);
    }

    // (Category, Parameter) -> field
    const std::map<std::pair<std::string, std::string>, double DispatchParams::*> fields = {
        {{"Dispatch", "Battery DoD Max"},               &DispatchParams::battery_dod_max},
        {{"Dispatch", "Diesel Min Load Fraction"},      &DispatchParams::diesel_min_load_fraction},
        {{"Dispatch", "Fuel Curve Idle Coeff"},         &DispatchParams::fuel_idle_coeff},
        {{"Dispatch", "Fuel Curve Proportional Coeff"}, &DispatchParams::fuel_prop_coeff},
        {{"Dispatch", "Battery Charge Efficiency"},     &DispatchParams::battery_charge_eff},
        {{"Dispatch", "Battery Discharge Efficiency"},  &DispatchParams::battery_discharge_eff},
        {{"Dispatch", "Battery Self Discharge Rate"},   &DispatchParams::battery_self_discharge},
        {{"Dispatch", "Battery Cycle Life Coeff A"},    &DispatchParams::cycle_life_coeff_a},
        {{"Dispatch", "Battery Cycle Life Coeff B"},    &DispatchParams::cycle_life_coeff_b},
        {{"Dispatch", "PV System Derating Factor"},     &DispatchParams::pv_system_derating},
        {{"Dispatch", "Battery Initial SOC"},           &DispatchParams::battery_initial_soc},
        {{"Solar",    "Temp Derating Coeff"},           &DispatchParams::pv_temp_derating_coeff},
        {{"Solar",    "NOCT Coeff"},                    &DispatchParams::pv_noct_coeff},
    };

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("Parameter file " + path + " is empty");
    }

    // Locate columns from the header so extra columns are tolerated.
    const auto header = split_csv_line(line);
    int col_cat = -1, col_par = -1, col_val = -1;
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == "Category")  col_cat = static_cast<int>(i);
        if (header[i] == "Parameter") col_par = static_cast<int>(i);
        if (header[i] == "Value")     col_val = static_cast<int>(i);
    }
    if (col_cat < 0 || col_par < 0 || col_val < 0) {
        throw std::runtime_error(
            "Parameter file " + path + " needs Category, Parameter and Value columns");
    }
    const std::size_t need = static_cast<std::size_t>(
        std::max(col_cat, std::max(col_par, col_val))) + 1;

    int overridden = 0;
    int lineno = 1;
    while (std::getline(in, line)) {
        ++lineno;
        const auto cells = split_csv_line(line);
        if (cells.size() < need) continue;

        const std::string& category = cells[col_cat];
        if (category.empty() || category[0] == '#') continue;

        const std::string& name  = cells[col_par];
        const std::string& value = cells[col_val];
        if (value.empty()) continue;

        const bool is_break_hour = (category == "Dispatch" && name == "Break Hour");
        const auto it = fields.find({category, name});
        if (!is_break_hour && it == fields.end()) continue;

        double v = 0.0;
        try {
            std::size_t used = 0;
            v = std::stod(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
        } catch (const std::exception&) {
            std::ostringstream oss;
            oss << "Parameter file " << path << " line " << lineno
                << ": non-numeric value '" << value << "' for " << category
                << "/" << name;
            throw std::runtime_error(oss.str());
        }

        if (is_break_hour) {
            if (std::floor(v) != v || v < 0.0 || v > 23.0) {
                std::ostringstream oss;
                oss << "Parameter file " << path << " line " << lineno
                    << ": Break Hour must be a whole hour of day, got '" << value << "'";
                throw std::runtime_error(oss.str());
            }
            params.break_hour = static_cast<int>(v);
        } else {
            params.*(it->second) = v;
        }
        ++overridden;
    }

    return overridden;
}
