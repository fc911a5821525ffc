#include "ClimateSeries.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    const auto a = s.find_first_not_of(" \t\r\n");
    const auto b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

void require_year(const std::vector<double>& v, const char* what) {
    if (v.size() < static_cast<std::size_t>(HOURS_PER_YEAR)) {
        std::ostringstream oss;
        oss << "ClimateSeries: " << what << " has " << v.size()
            << " hourly values, expected at least " << HOURS_PER_YEAR;
        throw std::invalid_argument(oss.str());
    }
}

} // anonymous namespace

void ClimateSeries::validate() const {
    require_year(irradiance_Wm2, "irradiance");
    require_year(ambient_C, "temperature");
}

ClimateSeries ClimateSeries::fromArrays(const std::vector<double>& irradiance_Wm2,
                                        const std::vector<double>& ambient_C) {
    require_year(irradiance_Wm2, "irradiance");
    require_year(ambient_C, "temperature");

    ClimateSeries c;
    c.irradiance_Wm2.assign(irradiance_Wm2.begin(), irradiance_Wm2.begin() + HOURS_PER_YEAR);
    c.ambient_C.assign(ambient_C.begin(), ambient_C.begin() + HOURS_PER_YEAR);
    return c;
}

std::vector<double> loadClimateColumn(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open climate file " + path);
    }

    std::vector<double> values;
    values.reserve(HOURS_PER_YEAR + 24);

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (lineno <= CLIMATE_HEADER_LINES) continue;
        if (trim(line).empty()) continue;

        std::stringstream ls(line);
        std::string cell;
        int col = 0;
        bool found = false;
        while (std::getline(ls, cell, ';')) {
            if (col == CLIMATE_VALUE_COLUMN) { found = true; break; }
            ++col;
        }

        const std::string text = trim(cell);
        double v = 0.0;
        bool ok = found && !text.empty();
        if (ok) {
            try {
                std::size_t used = 0;
                v = std::stod(text, &used);
                ok = (used == text.size());
            } catch (const std::exception&) {
                ok = false;
            }
        }
        if (!ok) {
            std::ostringstream oss;
            oss << "Climate file " << path << " line " << lineno
                << ": no numeric value in column " << CLIMATE_VALUE_COLUMN;
            throw std::runtime_error(oss.str());
        }
        values.push_back(v);
    }

    if (values.size() < static_cast<std::size_t>(HOURS_PER_YEAR)) {
        std::ostringstream oss;
        oss << "Climate file " << path << " has " << values.size()
            << " rows, expected >= " << HOURS_PER_YEAR;
        throw std::runtime_error(oss.str());
    }

    values.resize(HOURS_PER_YEAR);
    return values;
}

ClimateSeries loadClimateSeries(const std::string& irradiance_path,
                                const std::string& temperature_path) {
    return ClimateSeries::fromArrays(loadClimateColumn(irradiance_path),
                                     loadClimateColumn(temperature_path));
}
