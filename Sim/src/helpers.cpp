#include "helpers.hpp"

#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace IsleHelpers {

// ---------------------------
// Tiny CLI helpers (no deps)
// ---------------------------
static bool arg_eq(const char* a, const char* b) {
  return std::strcmp(a, b) == 0;
}

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    if (arg_eq(argv[i], "--cases") && i + 1 < argc)        a.casesPath  = argv[++i];
    else if (arg_eq(argv[i], "--params") && i + 1 < argc)  a.paramsPath = argv[++i];
    else if (arg_eq(argv[i], "--ghi") && i + 1 < argc)     a.ghiPath    = argv[++i];
    else if (arg_eq(argv[i], "--temp") && i + 1 < argc)    a.tempPath   = argv[++i];
    else if (arg_eq(argv[i], "--trace"))                   a.trace      = true;
    else if (arg_eq(argv[i], "--help") || arg_eq(argv[i], "-h")) a.showHelp = true;
    else a.unknown.emplace_back(argv[i]);
  }
  return a;
}

void print_usage() {
  std::cout <<
    "Usage: islegrid_sim [--cases cases.txt] [--params parameters.csv]\n"
    "                    [--ghi GHI_hourly.csv] [--temp Temperature_hourly.csv]\n"
    "                    [--trace]\n"
    "\n"
    "  --cases   whitespace table: name pv_kw battery_kwh diesel_kw demand_kwh\n"
    "            (default: reference island set)\n"
    "  --params  Category,Parameter,Value CSV; Dispatch and Solar rows override\n"
    "            the default dispatch parameters\n"
    "  --ghi     hourly irradiance file (';'-separated, 22 header lines, col 4)\n"
    "  --temp    hourly ambient temperature file, same layout\n"
    "  --trace   also write <case>_hourly.csv with every settled hour\n"
    "\n"
    "Cases are spread round-robin over MPI ranks; rank 0 prints the summary\n"
    "and writes DispatchSummary.csv under $IG_LOG_DIR[/$RUN_ID].\n";
}

std::string default_data_path(const std::string& filename) {
  namespace fs = std::filesystem;
#ifdef PROJECT_SOURCE_DIR
  fs::path base = fs::path(PROJECT_SOURCE_DIR) / "data" / "supplementary";
#else
  fs::path base = fs::current_path() / "data" / "supplementary";
#endif
  return (base / filename).string();
}

std::vector<Case> reference_cases() {
  return {
    {"Small island (100 hh)",       50.0,    100.0,     30.0,       200000.0},
    {"Medium island (500 hh)",     300.0,    600.0,    150.0,      1000000.0},
    {"Large island (2000 hh)",    1200.0,   2400.0,    600.0,      4000000.0},
    {"Solar-only (no diesel)",     500.0,   1000.0,      0.0,       500000.0},
    {"Diesel-only (no solar)",       0.0,      0.0,    200.0,       500000.0},
    {"Capital-scale (constrained)", 5000.0, 10000.0,  50000.0,  200000000.0},
  };
}

std::vector<Case> load_cases(const std::string& path, LogFn log_fn) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open case file " + path);
  }

  std::vector<Case> cases;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) continue;
    if (line[first] == '#') continue;

    std::istringstream iss(line);
    Case c{};
    std::string extra;
    if (!(iss >> c.name >> c.pv_kw >> c.battery_kwh >> c.diesel_kw >> c.demand_kwh) ||
        (iss >> extra)) {
      std::ostringstream oss;
      oss << "[warn] " << path << " line " << lineno
          << " malformed, skipping: " << line << "\n";
      if (log_fn) log_fn(oss.str());
      continue;
    }
    cases.push_back(c);
  }
  return cases;
}

std::string sanitize_name(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (unsigned char ch : name) {
    if (std::isalnum(ch) || ch == '-' || ch == '_') out.push_back(static_cast<char>(ch));
    else if (!out.empty() && out.back() != '_') out.push_back('_');
  }
  while (!out.empty() && out.back() == '_') out.pop_back();
  return out.empty() ? "case" : out;
}

} // namespace IsleHelpers
