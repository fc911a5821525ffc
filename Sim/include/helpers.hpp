#pragma once

#include <functional>
#include <string>
#include <vector>

namespace IsleHelpers {

// ---------------------------
// CLI arguments / config
// ---------------------------
struct Args {
  std::string casesPath;                 // empty -> reference island set
  std::string paramsPath;                // empty -> built-in defaults
  std::string ghiPath;                   // empty -> data/supplementary/GHI_hourly.csv
  std::string tempPath;                  // empty -> data/supplementary/Temperature_hourly.csv
  bool        trace    = false;          // write <case>_hourly.csv per case
  bool        showHelp = false;
  std::vector<std::string> unknown;      // flags we did not recognise
};

// ---------------------------
// One island configuration
// ---------------------------
struct Case {
  std::string name;
  double pv_kw       = 0.0;
  double battery_kwh = 0.0;
  double diesel_kw   = 0.0;
  double demand_kwh  = 0.0;
};

// Logger function type used by helpers (implemented in main.cpp).
using LogFn = std::function<void(const std::string&)>;

// Argument helpers
Args parse_args(int argc, char** argv);
void print_usage();

// Default data file under <PROJECT_SOURCE_DIR>/data/supplementary (or ./data/...).
std::string default_data_path(const std::string& filename);

// Reference island configurations (small to capital-scale).
std::vector<Case> reference_cases();

// Read "name pv_kw battery_kwh diesel_kw demand_kwh" rows; '#' starts a
// comment line. Malformed rows are reported through log_fn and skipped.
// Throws std::runtime_error if the file cannot be opened.
std::vector<Case> load_cases(const std::string& path, LogFn log_fn);

// File-system safe version of a case name (used for trace CSV names).
std::string sanitize_name(const std::string& name);

} // namespace IsleHelpers
