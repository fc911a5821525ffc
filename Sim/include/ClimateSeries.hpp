#pragma once

#include <string>
#include <vector>

#include "HourContext.hpp"

// Two aligned hourly arrays for one simulated year.
// Irradiance is global horizontal in W/m², temperature is ambient in °C.
struct ClimateSeries {
    std::vector<double> irradiance_Wm2;
    std::vector<double> ambient_C;

    // Throws std::invalid_argument if either array holds fewer than 8760
    // entries. Extra trailing entries are tolerated and ignored.
    void validate() const;

    // Build from caller arrays, truncated to 8760 entries. Validates first.
    static ClimateSeries fromArrays(const std::vector<double>& irradiance_Wm2,
                                    const std::vector<double>& ambient_C);
};

// Header lines preceding the data rows in the supplementary climate files.
constexpr int CLIMATE_HEADER_LINES = 22;
// Zero-based column holding the value in the ';'-separated rows.
constexpr int CLIMATE_VALUE_COLUMN = 4;

// Read one value column from a ';'-separated climate file, skipping the
// fixed header. Throws std::runtime_error if the file cannot be opened, a
// row has no parsable value in the column, or fewer than 8760 rows result.
std::vector<double> loadClimateColumn(const std::string& path);

// Load irradiance and temperature files into a validated ClimateSeries.
ClimateSeries loadClimateSeries(const std::string& irradiance_path,
                                const std::string& temperature_path);
