// Sim/src/main.cpp
// mpirun -np 4 ./build/islegrid_sim
/**
Build (from repo root):
  cmake -S . -B build -DCMAKE_BUILD_TYPE=Release
  cmake --build build -j

Run (from repo root):
  mpirun -np 4 ./build/islegrid_sim                                   // reference island set
  mpirun -np 4 ./build/islegrid_sim --cases input/cases.txt \
    --params input/parameters.csv --trace
  RUN_ID=maldives_base IG_LOG_DIR=/tmp/islegrid mpirun -np 2 ./build/islegrid_sim

Climate files default to data/supplementary/{GHI,Temperature}_hourly.csv.
*/

#include <mpi.h>
#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ClimateSeries.hpp"
#include "DispatchEngine.hpp"
#include "DispatchParams.hpp"
#include "DispatchResult.hpp"
#include "Logger.hpp"
#include "helpers.hpp"

using IsleHelpers::Args;
using IsleHelpers::Case;
using IsleHelpers::LogFn;
using IsleHelpers::parse_args;
using IsleHelpers::print_usage;

namespace {

// Fixed order for shipping DispatchParams to the other ranks.
constexpr int PACKED_PARAMS = 16;

std::vector<double> pack_params(const DispatchParams& p) {
  return {
    p.pv_temp_derating_coeff, p.pv_noct_coeff, p.pv_system_derating,
    p.battery_dod_max, p.battery_charge_eff, p.battery_discharge_eff,
    p.battery_self_discharge, p.battery_initial_soc,
    p.cycle_life_coeff_a, p.cycle_life_coeff_b,
    p.diesel_min_load_fraction, p.fuel_idle_coeff, p.fuel_prop_coeff,
    static_cast<double>(p.break_hour),
    p.reserve_aware_dispatch ? 1.0 : 0.0,
    0.0,  // spare
  };
}

DispatchParams unpack_params(const std::vector<double>& v) {
  DispatchParams p;
  p.pv_temp_derating_coeff   = v[0];
  p.pv_noct_coeff            = v[1];
  p.pv_system_derating       = v[2];
  p.battery_dod_max          = v[3];
  p.battery_charge_eff       = v[4];
  p.battery_discharge_eff    = v[5];
  p.battery_self_discharge   = v[6];
  p.battery_initial_soc      = v[7];
  p.cycle_life_coeff_a       = v[8];
  p.cycle_life_coeff_b       = v[9];
  p.diesel_min_load_fraction = v[10];
  p.fuel_idle_coeff          = v[11];
  p.fuel_prop_coeff          = v[12];
  p.break_hour               = static_cast<int>(v[13]);
  p.reserve_aware_dispatch   = v[14] != 0.0;
  return p;
}

void write_trace(const std::string& case_name, const std::vector<HourOutcome>& trace) {
  const std::string stream = IsleHelpers::sanitize_name(case_name) + "_hourly";
  const std::vector<std::string> cols = {
    "hour_of_day", "demand_kwh", "pv_kwh", "pv_to_load_kwh", "pv_to_battery_kwh",
    "curtailed_kwh", "diesel_kwh", "diesel_to_battery_kwh", "diesel_spilled_kwh",
    "battery_discharge_kwh", "unmet_kwh", "fuel_litres", "soc"
  };
  for (const HourOutcome& h : trace) {
    Logger::instance().log_wide(
      stream, h.hour_index, static_cast<double>(h.hour_index), cols,
      { static_cast<double>(h.hour_of_day), h.demand_kwh, h.pv_kwh,
        h.pv_to_load_kwh, h.pv_to_battery_kwh, h.curtailed_kwh,
        h.diesel_kwh, h.diesel_to_battery_kwh, h.diesel_spilled_kwh,
        h.battery_discharge_kwh, h.unmet_kwh, h.fuel_litres, h.soc }
    );
  }
}

void print_table(const std::vector<Case>& cases,
                 const std::vector<double>& packed,
                 std::ostream& os) {
  os << std::left << std::setw(30) << "Case" << std::right
     << std::setw(8) << "PV CF" << std::setw(8) << "Curt%"
     << std::setw(9) << "Diesel%" << std::setw(8) << "LPSP"
     << std::setw(10) << "Fuel kL" << std::setw(8) << "DslHrs"
     << std::setw(8) << "BatCyc" << "\n";
  os << std::string(89, '-') << "\n";

  for (std::size_t i = 0; i < cases.size(); ++i) {
    const double* slot = packed.data() + i * DispatchResult::PACKED_SIZE;
    os << std::left << std::setw(30) << cases[i].name << std::right;
    if (slot[DispatchResult::PACKED_SIZE - 1] == 0.0) {
      os << "  (failed, see log)\n";
      continue;
    }
    const DispatchResult r = DispatchResult::unpack(slot);
    os << std::fixed
       << std::setw(8) << std::setprecision(3) << r.effectivePvCapacityFactor()
       << std::setw(7) << std::setprecision(1) << r.curtailmentFraction() * 100.0 << "%"
       << std::setw(8) << std::setprecision(1) << r.dieselShare() * 100.0 << "%"
       << std::setw(8) << std::setprecision(4) << r.lpsp()
       << std::setw(10) << std::setprecision(1) << r.fuelLitres() / 1000.0
       << std::setw(8) << r.dieselHours()
       << std::setw(8) << std::setprecision(1) << r.batteryCycles()
       << "\n";
    os.unsetf(std::ios::fixed);
  }
}

} // anonymous namespace

int main(int argc, char** argv) {
  MPI_Init(&argc, &argv);

  int rank = 0, size = 1;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  MPI_Comm_size(MPI_COMM_WORLD, &size);

  Args args = parse_args(argc, argv);

  // ------------------------------------------------------------------------
  // Run logger: mirrors messages to stderr and a per-run file on rank 0.
  // Log file name: dispatch_debug_<RUN_ID>.log (in the working directory).
  // ------------------------------------------------------------------------
  std::ofstream debugLog;
  LogFn log_msg = [&](const std::string& s) {
    if (rank == 0) {
      std::cerr << s;
      if (debugLog.is_open()) {
        debugLog << s;
        debugLog.flush();
      }
    }
  };

  if (rank == 0) {
    const char* env_run_id = std::getenv("RUN_ID");
    std::string run_id     = (env_run_id && *env_run_id) ? env_run_id : "norunid";

    std::string filename = "dispatch_debug_" + run_id + ".log";
    debugLog.open(filename, std::ios::out | std::ios::app);
    if (!debugLog) {
      std::cerr << "[warn] Failed to open " << filename << " for writing.\n";
    } else {
      debugLog << "============================================================\n";
      debugLog << "New run started (RUN_ID=" << run_id
               << ", world_size=" << size << ")\n";
      debugLog << "============================================================\n";
      debugLog.flush();
    }
  }

  if (args.showHelp) {
    if (rank == 0) print_usage();
    MPI_Finalize();
    return 0;
  }

  for (const auto& flag : args.unknown) {
    log_msg("[warn] Ignoring unrecognised argument: " + flag + "\n");
  }

  if (args.ghiPath.empty())  args.ghiPath  = IsleHelpers::default_data_path("GHI_hourly.csv");
  if (args.tempPath.empty()) args.tempPath = IsleHelpers::default_data_path("Temperature_hourly.csv");

  int exit_code = 0;

  try {
    // --------------------------------------------------------------------
    // Rank 0 loads parameters, climate and cases; everyone else waits.
    // --------------------------------------------------------------------
    DispatchParams params;
    ClimateSeries  climate;
    std::vector<Case> cases;
    int load_ok = 1;

    if (rank == 0) {
      try {
        std::ostringstream oss;
        oss << "[info] MPI world size = " << size << "\n";
        oss << "[info] Args: cases=" << (args.casesPath.empty() ? "<reference>" : args.casesPath)
            << " params=" << (args.paramsPath.empty() ? "<defaults>" : args.paramsPath)
            << " ghi=" << args.ghiPath
            << " temp=" << args.tempPath
            << " trace=" << (args.trace ? 1 : 0) << "\n";
        const char* env_log_dir = std::getenv("IG_LOG_DIR");
        oss << "[info] Env: IG_LOG_DIR=" << (env_log_dir ? env_log_dir : "<unset>") << "\n";
        oss << "[info] Output dir: " << Logger::output_dir().string() << "\n";
        log_msg(oss.str());

        if (!args.paramsPath.empty()) {
          const int n = loadParameterCsv(args.paramsPath, params);
          log_msg("[info] Loaded " + std::to_string(n) + " dispatch parameter(s) from " +
                  args.paramsPath + "\n");
        }
        params.validate();

        climate = loadClimateSeries(args.ghiPath, args.tempPath);
        log_msg("[info] Loaded " + std::to_string(climate.irradiance_Wm2.size()) +
                " hours of climate data\n");

        if (args.casesPath.empty()) {
          cases = IsleHelpers::reference_cases();
        } else {
          cases = IsleHelpers::load_cases(args.casesPath, log_msg);
        }
        if (cases.empty()) {
          throw std::runtime_error("No cases to run");
        }
        log_msg("[info] Running " + std::to_string(cases.size()) + " case(s)\n");
      } catch (const std::exception& e) {
        log_msg(std::string("[fatal] ") + e.what() + "\n");
        load_ok = 0;
      }
    }

    MPI_Bcast(&load_ok, 1, MPI_INT, 0, MPI_COMM_WORLD);
    if (!load_ok) {
      MPI_Finalize();
      return 1;
    }

    // --------------------------------------------------------------------
    // Broadcast parameters, climate arrays and case capacities.
    // --------------------------------------------------------------------
    std::vector<double> packed_params = pack_params(params);
    packed_params.resize(PACKED_PARAMS);
    MPI_Bcast(packed_params.data(), PACKED_PARAMS, MPI_DOUBLE, 0, MPI_COMM_WORLD);
    params = unpack_params(packed_params);

    climate.irradiance_Wm2.resize(HOURS_PER_YEAR);
    climate.ambient_C.resize(HOURS_PER_YEAR);
    MPI_Bcast(climate.irradiance_Wm2.data(), HOURS_PER_YEAR, MPI_DOUBLE, 0, MPI_COMM_WORLD);
    MPI_Bcast(climate.ambient_C.data(), HOURS_PER_YEAR, MPI_DOUBLE, 0, MPI_COMM_WORLD);

    int ncases = static_cast<int>(cases.size());
    MPI_Bcast(&ncases, 1, MPI_INT, 0, MPI_COMM_WORLD);

    std::vector<double> capacities(static_cast<std::size_t>(ncases) * 4);
    if (rank == 0) {
      for (int i = 0; i < ncases; ++i) {
        capacities[i * 4 + 0] = cases[i].pv_kw;
        capacities[i * 4 + 1] = cases[i].battery_kwh;
        capacities[i * 4 + 2] = cases[i].diesel_kw;
        capacities[i * 4 + 3] = cases[i].demand_kwh;
      }
    }
    MPI_Bcast(capacities.data(), ncases * 4, MPI_DOUBLE, 0, MPI_COMM_WORLD);

    // Only rank 0 holds names; the others label traces by index.
    if (rank != 0) {
      cases.resize(ncases);
      for (int i = 0; i < ncases; ++i) cases[i].name = "case_" + std::to_string(i);
    }

    // --------------------------------------------------------------------
    // Round-robin: rank r runs cases r, r+size, ...
    // --------------------------------------------------------------------
    const std::size_t W = DispatchResult::PACKED_SIZE;
    std::vector<double> local(static_cast<std::size_t>(ncases) * W, 0.0);
    std::vector<double> global(local.size(), 0.0);

    for (int i = rank; i < ncases; i += size) {
      SimulationInputs in;
      in.pv_capacity_kw       = capacities[i * 4 + 0];
      in.battery_capacity_kwh = capacities[i * 4 + 1];
      in.diesel_capacity_kw   = capacities[i * 4 + 2];
      in.annual_demand_kwh    = capacities[i * 4 + 3];
      in.params               = params;

      try {
        std::vector<HourOutcome> trace;
        const DispatchResult r = runDispatch(in, climate, args.trace ? &trace : nullptr);
        const std::vector<double> p = r.pack();
        std::copy(p.begin(), p.end(), local.begin() + static_cast<std::ptrdiff_t>(i * W));
        if (args.trace) write_trace(cases[i].name, trace);
      } catch (const std::invalid_argument& e) {
        // A bad row should not take the whole batch down.
        std::cerr << "[warn] rank " << rank << " case " << i
                  << " rejected: " << e.what() << "\n";
      }
    }

    MPI_Reduce(local.data(), global.data(), static_cast<int>(global.size()),
               MPI_DOUBLE, MPI_SUM, 0, MPI_COMM_WORLD);

    // --------------------------------------------------------------------
    // Rank 0: table + DispatchSummary.csv
    // --------------------------------------------------------------------
    if (rank == 0) {
      std::ostringstream table;
      print_table(cases, global, table);
      std::cout << table.str();
      if (debugLog.is_open()) debugLog << table.str();

      int failed = 0;
      for (int i = 0; i < ncases; ++i) {
        const double* slot = global.data() + static_cast<std::size_t>(i) * W;
        if (slot[W - 1] == 0.0) { ++failed; continue; }
        const DispatchResult r = DispatchResult::unpack(slot);

        std::vector<std::string> cols;
        std::vector<double> vals;
        for (const auto& kv : r.summary()) {
          cols.push_back(kv.first);
          vals.push_back(kv.second);
        }
        Logger::instance().log_labeled("DispatchSummary", cases[i].name, cols, vals);
      }

      if (failed > 0) {
        log_msg("[warn] " + std::to_string(failed) + " case(s) failed validation\n");
        exit_code = 2;
      }
      log_msg("[info] Summary written to " +
              (Logger::output_dir() / "DispatchSummary.csv").string() + "\n");
    }

    Logger::instance().close_all();
  } catch (const std::exception& e) {
    if (rank == 0) {
      log_msg(std::string("[fatal] ") + e.what() + "\n");
    } else {
      std::cerr << "[fatal] rank " << rank << ": " << e.what() << "\n";
    }
    MPI_Abort(MPI_COMM_WORLD, 1);
  }

  MPI_Finalize();
  return exit_code;
}
