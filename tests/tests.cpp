// Keep assert() live in Release test builds.
#undef NDEBUG

#include "Battery.hpp"
#include "ClimateSeries.hpp"
#include "DieselGenerator.hpp"
#include "DispatchEngine.hpp"
#include "DispatchPolicy.hpp"
#include "DispatchResult.hpp"
#include "LoadProfile.hpp"
#include "Logger.hpp"
#include "SolarArray.hpp"
#include "helpers.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr double PI  = 3.14159265358979323846;
constexpr double EPS = 1e-9;

bool near(double a, double b, double tol = EPS) {
    return std::fabs(a - b) <= tol * std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
}

// Clear-sky-like tropical year: sine irradiance between 06:00 and 18:00,
// 28 °C mean with a ±2 °C afternoon-peaking swing.
ClimateSeries tropical_climate(double peak_Wm2 = 900.0) {
    ClimateSeries c;
    c.irradiance_Wm2.resize(HOURS_PER_YEAR);
    c.ambient_C.resize(HOURS_PER_YEAR);
    for (int i = 0; i < HOURS_PER_YEAR; ++i) {
        const int h = i % HOURS_PER_DAY;
        const double g = (h > 6 && h < 18) ? peak_Wm2 * std::sin(PI * (h - 6) / 12.0) : 0.0;
        c.irradiance_Wm2[i] = std::max(0.0, g);
        c.ambient_C[i]      = 28.0 + 2.0 * std::sin(PI * (h - 9) / 12.0);
    }
    return c;
}

SimulationInputs island(double pv, double battery, double diesel, double demand) {
    SimulationInputs in;
    in.pv_capacity_kw       = pv;
    in.battery_capacity_kwh = battery;
    in.diesel_capacity_kw   = diesel;
    in.annual_demand_kwh    = demand;
    return in;
}

fs::path scratch_dir(const std::string& name) {
    fs::path p = fs::temp_directory_path() / ("islegrid_tests_" + name);
    fs::create_directories(p);
    return p;
}

template <typename Ex, typename Fn>
bool throws(Fn fn) {
    try {
        fn();
    } catch (const Ex&) {
        return true;
    }
    return false;
}

} // anonymous namespace

// Test 1: load profile tiles the shape over 365 days
void test_load_profile() {
    const double annual = 1'000'000.0;
    const auto profile = buildLoadProfile(annual);
    assert(profile.size() == static_cast<std::size_t>(HOURS_PER_YEAR));

    double sum = 0.0;
    for (int i = 0; i < HOURS_PER_YEAR; ++i) {
        assert(profile[i] == TIER5_LOAD_SHAPE[i % 24] * (annual / 365.0));
        sum += profile[i];
    }
    assert(near(sum, annual, 1e-6));
    // Evening peak at 19:00
    assert(profile[19] > profile[18] && profile[19] > profile[20]);

    DiurnalShape flat;
    flat.fill(1.0 / 24.0);
    const auto flat_profile = buildLoadProfile(365.0 * 24.0, flat);
    assert(near(flat_profile[0], 1.0) && near(flat_profile[8759], 1.0));

    assert(throws<std::invalid_argument>([] { buildLoadProfile(0.0); }));
    assert(throws<std::invalid_argument>([] { buildLoadProfile(-5.0); }));
    assert(throws<std::invalid_argument>([] { buildLoadProfile(std::nan("")); }));
    DiurnalShape bad = flat;
    bad[3] += 0.01;
    assert(throws<std::invalid_argument>([&] { buildLoadProfile(1000.0, bad); }));
    DiurnalShape negative = flat;
    negative[0] = -negative[0];
    negative[1] += 2.0 / 24.0;
    assert(throws<std::invalid_argument>([&] { buildLoadProfile(1000.0, negative); }));

    std::cout << "[PASS] Load profile tiles the diurnal shape.\n";
}

// Test 2: generation model with temperature derating
void test_solar_output() {
    DispatchParams p;
    SolarArray pv(100.0, p);

    assert(pv.output(0.0, 30.0) == 0.0);
    assert(pv.output(-20.0, 30.0) == 0.0);
    assert(pv.output(std::nan(""), 30.0) == 0.0);

    // T_cell = -0.6 + 25.6 * 1.0 = 25 °C -> no temperature loss
    assert(near(pv.output(1000.0, -0.6), 100.0 * 0.9));

    // 800 W/m² at 30 °C: T_cell = 50.48, d = 1 - 0.005 * 25.48
    const double d = 1.0 - 0.005 * (30.0 + 25.6 * 0.8 - 25.0);
    assert(near(pv.output(800.0, 30.0), 100.0 * 0.9 * 0.8 * d));
    assert(near(pv.cellTemperature(800.0, 30.0), 30.0 + 25.6 * 0.8));

    // Absurd heat: derating floors at zero, never negative
    assert(pv.output(1000.0, 400.0) == 0.0);

    SolarArray none(0.0, p);
    assert(none.output(1000.0, 25.0) == 0.0);

    std::cout << "[PASS] PV output is derated and never negative.\n";
}

// Test 3: battery charge / discharge / floor
void test_battery_operations() {
    DispatchParams p;
    Battery b(100.0, p);
    const HourContext ctx = HourContext::at(10);
    assert(near(b.getSoc(), 0.5));
    assert(near(b.getFloorSoc(), 0.2));

    // Headroom 50 kWh stored -> 50 / 0.938 absorbable from the bus
    const ChargeResult ch = b.charge(100.0);
    assert(near(ch.absorbed_kwh, 50.0 / 0.938));
    assert(near(ch.absorbed_kwh + ch.curtailed_kwh, 100.0));
    assert(near(b.getSoc(), 1.0));
    assert(b.charge(5.0).curtailed_kwh == 5.0);

    // Deliverable above the floor: 0.8 * 100 * 0.938
    assert(near(b.availableDischargeKwh(), 80.0 * 0.938));
    assert(near(b.storedDischargeKwh(), 100.0 * 0.938));
    const DischargeResult dis = b.discharge(1000.0, ctx);
    assert(near(dis.delivered_kwh, 80.0 * 0.938));
    assert(near(dis.delivered_kwh + dis.unmet_kwh, 1000.0));
    assert(b.getSoc() >= b.getFloorSoc() - EPS);
    assert(near(b.getSoc(), 0.2));

    const DischargeResult empty = b.discharge(10.0, ctx);
    assert(near(empty.delivered_kwh, 0.0) && near(empty.unmet_kwh, 10.0));

    // Non-positive requests move nothing
    assert(b.charge(0.0).absorbed_kwh == 0.0);
    assert(b.discharge(-1.0, ctx).unmet_kwh == 0.0);

    std::cout << "[PASS] Battery respects headroom and DoD floor.\n";
}

// Test 4: zero-capacity battery is a pass-through
void test_battery_zero_capacity() {
    DispatchParams p;
    Battery b(0.0, p);
    const HourContext ctx = HourContext::at(0);

    const ChargeResult ch = b.charge(12.5);
    assert(ch.absorbed_kwh == 0.0 && ch.curtailed_kwh == 12.5);
    const DischargeResult dis = b.discharge(7.0, ctx);
    assert(dis.delivered_kwh == 0.0 && dis.unmet_kwh == 7.0);
    assert(b.availableDischargeKwh() == 0.0);
    assert(b.chargeHeadroomKwh() == 0.0);

    b.closeHour(ctx);
    assert(b.endOfDay() == 0.0);
    assert(b.getWear() == 0.0);

    std::cout << "[PASS] Zero-capacity battery charges and discharges nothing.\n";
}

// Test 5: self-discharge and end-of-day wear
void test_battery_self_discharge_and_wear() {
    DispatchParams p;
    Battery b(200.0, p);

    HourContext first = HourContext::at(0);
    b.selfDischarge(first);
    assert(near(b.getSoc(), 0.5 * (1.0 - 0.0002)));
    b.closeHour(first);

    // Draw 40 kWh at 01:00 -> SOC swing 40 / (0.938 * 200)
    const HourContext second = HourContext::at(1);
    b.selfDischarge(second);
    const double soc_before = b.getSoc();
    const DischargeResult dis = b.discharge(40.0, second);
    assert(near(dis.delivered_kwh, 40.0));
    const double swing = 40.0 / (0.938 * 200.0);
    assert(near(soc_before - b.getSoc(), swing));
    b.closeHour(second);

    const double leak = 0.0002 * 0.5 + 0.0002 * 0.5 * (1.0 - 0.0002);
    const double max_dod = 1.0 - b.getSoc();
    const double expected = (leak + swing) /
        (p.cycle_life_coeff_a * std::pow(std::max(0.1, max_dod * p.battery_dod_max),
                                         p.cycle_life_coeff_b));
    const double inc = b.endOfDay();
    assert(near(inc, expected, 1e-12));
    assert(near(b.getWear(), expected, 1e-12));

    // Buffers were reset: a full, idle day wears nothing
    Battery full(100.0, p);
    full.charge(1000.0);
    full.closeHour(HourContext::at(23));
    assert(full.endOfDay() == 0.0);

    assert(cycleWear(1.0, 0.0, 500.0, -1.0) == 1.0 / (500.0 * std::pow(0.1, -1.0)));

    std::cout << "[PASS] Self-discharge and cycle wear follow the power-law model.\n";
}

// Test 6: hour-of-day bands
void test_policy_bands() {
    assert(bandForHour(0, 17) == DispatchBand::Night);
    assert(bandForHour(4, 17) == DispatchBand::Night);
    assert(bandForHour(5, 17) == DispatchBand::Daytime);
    assert(bandForHour(17, 17) == DispatchBand::Daytime);
    assert(bandForHour(18, 17) == DispatchBand::Evening);
    assert(bandForHour(22, 17) == DispatchBand::Evening);
    assert(bandForHour(23, 17) == DispatchBand::Night);
    assert(bandForHour(15, 14) == DispatchBand::Evening);

    std::cout << "[PASS] Dispatch bands keyed on 4 / break hour / 23.\n";
}

// Test 7: pure diesel decision
void test_policy_decisions() {
    DispatchParams p;                 // min load 0.4
    const double C = 100.0;           // -> 40 kW floor

    BatteryView full;
    full.present = true;
    full.available_kwh = 500.0;
    full.headroom_kwh = 0.0;
    full.charge_eff = 0.938;

    BatteryView empty = full;
    empty.available_kwh = 0.0;
    empty.headroom_kwh = 300.0;

    // Daytime: battery covers -> no diesel; otherwise max(min load, net), capped
    assert(decideDieselOutput(10, 60.0, full, C, p) == 0.0);
    assert(decideDieselOutput(10, 60.0, empty, C, p) == 60.0);
    assert(decideDieselOutput(10, 10.0, empty, C, p) == 40.0);
    assert(decideDieselOutput(10, 250.0, empty, C, p) == C);

    // Evening: max useful = min(C, net + headroom / eff) if above min load
    assert(decideDieselOutput(19, 30.0, empty, C, p) == C);
    BatteryView small_room = empty;
    small_room.headroom_kwh = 5.0;
    assert(near(decideDieselOutput(19, 50.0, small_room, C, p), 50.0 + 5.0 / 0.938));
    assert(decideDieselOutput(19, 30.0, small_room, C, p) == 0.0);  // 35.3 < 40 floor
    assert(decideDieselOutput(19, 20.0, full, C, p) == 0.0);   // 20 < 40 floor
    assert(decideDieselOutput(19, 60.0, full, C, p) == 60.0);  // runs even with full battery

    // Night: run if battery short, at max(min load, max useful)
    assert(decideDieselOutput(2, 30.0, full, C, p) == 0.0);
    assert(decideDieselOutput(2, 10.0, empty, C, p) == C);
    assert(decideDieselOutput(23, 10.0, small_room, C, p) == 40.0);

    // No battery: max useful is the net load itself
    BatteryView none;
    assert(decideDieselOutput(2, 10.0, none, C, p) == 40.0);
    assert(decideDieselOutput(20, 55.0, none, C, p) == 55.0);

    // No diesel, no deficit
    assert(decideDieselOutput(10, 60.0, empty, 0.0, p) == 0.0);
    assert(decideDieselOutput(10, 0.0, empty, C, p) == 0.0);
    assert(decideDieselOutput(10, -5.0, empty, C, p) == 0.0);

    std::cout << "[PASS] Diesel decision table matches band rules.\n";
}

// Test 8: two-part fuel curve
void test_fuel_curve() {
    DispatchParams p;
    DieselGenerator g(100.0, p);
    assert(g.fuelLitres(0.0) == 0.0);
    assert(near(g.fuelLitres(50.0), 100.0 * 0.08145 + 50.0 * 0.246));
    assert(near(g.minimumLoadKw(), 40.0));

    DieselGenerator none(0.0, p);
    assert(none.fuelLitres(0.0) == 0.0);

    std::cout << "[PASS] Fuel curve charges idle fuel only when running.\n";
}

// Test 9: climate arrays must cover the year
void test_climate_validation() {
    std::vector<double> year(HOURS_PER_YEAR, 1.0);
    std::vector<double> short_year(HOURS_PER_YEAR - 1, 1.0);
    std::vector<double> long_year(HOURS_PER_YEAR + 48, 2.0);

    assert(throws<std::invalid_argument>([&] { ClimateSeries::fromArrays(short_year, year); }));
    assert(throws<std::invalid_argument>([&] { ClimateSeries::fromArrays(year, short_year); }));

    const ClimateSeries c = ClimateSeries::fromArrays(long_year, year);
    assert(c.irradiance_Wm2.size() == static_cast<std::size_t>(HOURS_PER_YEAR));
    assert(c.ambient_C.size() == static_cast<std::size_t>(HOURS_PER_YEAR));

    ClimateSeries raw;
    raw.irradiance_Wm2 = short_year;
    raw.ambient_C = year;
    assert(throws<std::invalid_argument>([&] { runDispatch(island(10, 10, 10, 1000), raw); }));

    // Extra trailing hours are ignored by the engine
    ClimateSeries padded = tropical_climate();
    const DispatchResult base = runDispatch(island(50, 100, 30, 200000), padded);
    padded.irradiance_Wm2.push_back(5000.0);
    padded.ambient_C.push_back(90.0);
    assert(runDispatch(island(50, 100, 30, 200000), padded) == base);

    std::cout << "[PASS] Climate series shorter than a year are rejected.\n";
}

// Test 10: ';'-separated climate files with a 22-line header
void test_climate_loader() {
    const fs::path dir = scratch_dir("climate");
    const fs::path ghi = dir / "GHI_hourly.csv";
    const fs::path tmp = dir / "Temperature_hourly.csv";
    const fs::path shortf = dir / "short.csv";

    auto write = [](const fs::path& path, int rows, double base) {
        std::ofstream out(path);
        for (int i = 0; i < CLIMATE_HEADER_LINES; ++i) out << "# header line " << i << "\n";
        for (int i = 0; i < rows; ++i) {
            out << "2019;" << (i / 24 + 1) << ";" << (i % 24) << ";site;" << (base + i % 24) << "\n";
            if (i == 100) out << "\n";
        }
    };
    write(ghi, HOURS_PER_YEAR + 24, 0.0);
    write(tmp, HOURS_PER_YEAR, 20.0);
    write(shortf, 100, 0.0);

    const ClimateSeries c = loadClimateSeries(ghi.string(), tmp.string());
    assert(c.irradiance_Wm2.size() == static_cast<std::size_t>(HOURS_PER_YEAR));
    assert(c.irradiance_Wm2[0] == 0.0 && c.irradiance_Wm2[13] == 13.0);
    assert(c.ambient_C[25] == 21.0);

    assert(throws<std::runtime_error>([&] { loadClimateColumn(shortf.string()); }));
    assert(throws<std::runtime_error>([&] { loadClimateColumn((dir / "missing.csv").string()); }));

    {
        std::ofstream bad(dir / "bad.csv");
        for (int i = 0; i < CLIMATE_HEADER_LINES; ++i) bad << "header\n";
        bad << "a;b;c;d;not-a-number\n";
    }
    assert(throws<std::runtime_error>([&] { loadClimateColumn((dir / "bad.csv").string()); }));

    fs::remove_all(dir);
    std::cout << "[PASS] Climate loader skips the header and reads column 4.\n";
}

// Test 11: parameter CSV overrides
void test_parameter_csv() {
    const fs::path dir = scratch_dir("params");
    const fs::path path = dir / "parameters.csv";
    {
        std::ofstream out(path);
        out << "Category,Parameter,Value,Low,High,Source\n";
        out << "# comment,ignored,1,,,\n";
        out << "Dispatch,Battery DoD Max,0.9,0.7,0.95,vendor\n";
        out << "Dispatch,Break Hour,16,,,\n";
        out << "Dispatch,Unknown Knob,3,,,\n";
        out << "Solar,NOCT Coeff,30,,,\n";
        out << "Costs,Diesel Price,0.85,,,\n";
    }

    DispatchParams p;
    const int n = loadParameterCsv(path.string(), p);
    assert(n == 3);
    assert(p.battery_dod_max == 0.9);
    assert(p.break_hour == 16);
    assert(p.pv_noct_coeff == 30.0);
    assert(p.diesel_min_load_fraction == 0.40);
    p.validate();

    {
        std::ofstream out(dir / "bad.csv");
        out << "Category,Parameter,Value\n";
        out << "Dispatch,Battery DoD Max,lots\n";
    }
    DispatchParams q;
    assert(throws<std::runtime_error>([&] { loadParameterCsv((dir / "bad.csv").string(), q); }));
    assert(throws<std::runtime_error>([&] { loadParameterCsv((dir / "none.csv").string(), q); }));

    // Break Hour must be a whole hour of day
    for (const char* hour : {"16.7", "-3", "40"}) {
        {
            std::ofstream out(dir / "hour.csv");
            out << "Category,Parameter,Value\n";
            out << "Dispatch,Break Hour," << hour << "\n";
        }
        DispatchParams h;
        assert(throws<std::runtime_error>([&] { loadParameterCsv((dir / "hour.csv").string(), h); }));
        assert(h.break_hour == 17);
    }

    DispatchParams invalid;
    invalid.battery_dod_max = 0.0;
    assert(throws<std::invalid_argument>([&] { invalid.validate(); }));
    invalid = DispatchParams{};
    invalid.break_hour = 23;
    assert(throws<std::invalid_argument>([&] { invalid.validate(); }));

    fs::remove_all(dir);
    std::cout << "[PASS] Parameter CSV overrides Dispatch and Solar rows.\n";
}

// Test 12: SOC stays in [0, 1]; discharge never goes below the floor
void test_soc_bounds() {
    const ClimateSeries climate = tropical_climate();
    const std::vector<SimulationInputs> configs = {
        island(50, 100, 30, 200000),
        island(300, 600, 150, 1000000),
        island(500, 1000, 0, 500000),
        island(2000, 50, 0, 300000),
        island(10, 5000, 400, 2000000),
    };

    for (SimulationInputs in : configs) {
        for (double soc0 : {0.0, 0.1, 0.5, 1.0}) {
            in.params.battery_initial_soc = soc0;
            std::vector<HourOutcome> trace;
            runDispatch(in, climate, &trace);
            assert(trace.size() == static_cast<std::size_t>(HOURS_PER_YEAR));

            const double floor_soc = 1.0 - in.params.battery_dod_max;
            for (const HourOutcome& h : trace) {
                assert(h.soc >= 0.0 && h.soc <= 1.0);
                if (h.battery_discharge_kwh > 0.0) {
                    assert(h.soc >= floor_soc - EPS);
                }
            }
        }
    }
    std::cout << "[PASS] SOC bounded and floor respected for every hour.\n";
}

// Test 13: per-hour energy balance
void test_energy_balance() {
    const ClimateSeries climate = tropical_climate();
    std::vector<HourOutcome> trace;
    const DispatchResult r = runDispatch(island(300, 600, 150, 1000000), climate, &trace);

    double pv = 0.0, diesel = 0.0, discharge = 0.0, curtailed = 0.0, unmet = 0.0;
    for (const HourOutcome& h : trace) {
        assert(near(h.pv_to_load_kwh + h.pv_to_battery_kwh + h.curtailed_kwh, h.pv_kwh));
        assert(near(h.diesel_to_load_kwh + h.diesel_to_battery_kwh + h.diesel_spilled_kwh,
                    h.diesel_kwh));
        assert(near(h.pv_to_load_kwh + h.diesel_to_load_kwh + h.battery_discharge_kwh +
                    h.unmet_kwh, h.demand_kwh));
        assert(h.pv_to_battery_kwh >= 0.0 && h.curtailed_kwh >= 0.0);
        pv += h.pv_kwh;
        diesel += h.diesel_kwh;
        discharge += h.battery_discharge_kwh;
        curtailed += h.curtailed_kwh;
        unmet += h.unmet_kwh;
    }
    assert(pv == r.pvGenerationKwh());
    assert(diesel == r.dieselGenerationKwh());
    assert(discharge == r.batteryDischargeKwh());
    assert(curtailed == r.curtailmentKwh());
    assert(unmet == r.unmetDemandKwh());

    std::cout << "[PASS] Generation = consumed + charged + curtailed every hour.\n";
}

// Test 14: no battery -> no discharge, all surplus curtailed
void test_zero_battery() {
    const ClimateSeries climate = tropical_climate();
    const SimulationInputs in = island(400, 0, 100, 600000);
    const DispatchResult r = runDispatch(in, climate);

    assert(r.batteryDischargeKwh() == 0.0);
    assert(r.batteryCycles() == 0.0);
    assert(r.batteryUtilisation() == 0.0);
    assert(r.batteryWear() == 0.0);

    const auto load = buildLoadProfile(in.annual_demand_kwh);
    SolarArray pv(in.pv_capacity_kw, in.params);
    double surplus = 0.0;
    int surplus_hours = 0;
    for (int i = 0; i < HOURS_PER_YEAR; ++i) {
        const double net = load[i] - pv.output(climate.irradiance_Wm2[i], climate.ambient_C[i]);
        if (net < 0.0) {
            surplus += -net;
            ++surplus_hours;
        }
    }
    assert(surplus > 0.0);
    assert(r.curtailmentKwh() == surplus);
    assert(r.curtailmentHours() == surplus_hours);

    std::cout << "[PASS] Zero battery curtails exactly the surplus.\n";
}

// Test 15: no diesel -> no diesel energy, no fuel
void test_zero_diesel() {
    const ClimateSeries climate = tropical_climate();
    std::vector<HourOutcome> trace;
    const DispatchResult r = runDispatch(island(300, 600, 0, 1000000), climate, &trace);

    assert(r.dieselGenerationKwh() == 0.0);
    assert(r.fuelLitres() == 0.0);
    assert(r.dieselHours() == 0);
    assert(r.dieselShare() == 0.0);
    for (const HourOutcome& h : trace) {
        assert(h.diesel_kwh == 0.0 && h.fuel_litres == 0.0);
    }
    assert(r.unmetDemandKwh() > 0.0);

    std::cout << "[PASS] Zero diesel burns no fuel.\n";
}

// Test 16: a running generator is never below minimum load
void test_minimum_load() {
    const ClimateSeries climate = tropical_climate();
    for (double diesel_kw : {30.0, 150.0, 600.0}) {
        SimulationInputs in = island(300, 600, diesel_kw, 1000000);
        std::vector<HourOutcome> trace;
        runDispatch(in, climate, &trace);

        const double floor_kw = in.params.diesel_min_load_fraction * diesel_kw;
        int running = 0;
        for (const HourOutcome& h : trace) {
            if (h.diesel_kwh > 0.0) {
                ++running;
                assert(h.diesel_kwh >= floor_kw - EPS);
                assert(h.diesel_kwh <= diesel_kw + EPS);
                assert(near(h.fuel_litres, diesel_kw * in.params.fuel_idle_coeff +
                                           h.diesel_kwh * in.params.fuel_prop_coeff));
            } else {
                assert(h.fuel_litres == 0.0);
            }
        }
        assert(running > 0);
    }
    std::cout << "[PASS] Diesel output respects the minimum-load floor.\n";
}

// Test 17: identical inputs, identical results
void test_determinism() {
    const ClimateSeries climate = tropical_climate();
    const SimulationInputs in = island(1200, 2400, 600, 4000000);

    std::vector<HourOutcome> t1, t2;
    const DispatchResult a = runDispatch(in, climate, &t1);
    const DispatchResult b = runDispatch(in, climate, &t2);
    assert(a == b);
    assert(a.pack() == b.pack());
    for (int i = 0; i < HOURS_PER_YEAR; ++i) {
        assert(t1[i].soc == t2[i].soc);
        assert(t1[i].diesel_kwh == t2[i].diesel_kwh);
    }

    // Shipping a result between ranks preserves it
    assert(DispatchResult::unpack(a.pack().data()) == a);

    std::cout << "[PASS] Dispatch is deterministic.\n";
}

// Test 18: reference island fixtures
void test_scenario_fixtures() {
    const ClimateSeries climate = tropical_climate();

    const DispatchResult solar_only = runDispatch(island(500, 1000, 0, 500000), climate);
    assert(solar_only.dieselGenerationKwh() == 0.0);
    assert(solar_only.fuelLitres() == 0.0);
    assert(solar_only.pvGenerationKwh() > 0.0);
    assert(solar_only.curtailmentKwh() > 0.0);
    assert(solar_only.batteryCycles() > 0.0);

    const DispatchResult diesel_only = runDispatch(island(0, 0, 200, 500000), climate);
    assert(diesel_only.pvGenerationKwh() == 0.0);
    assert(diesel_only.curtailmentKwh() == 0.0);
    assert(diesel_only.curtailmentHours() == 0);
    assert(diesel_only.dieselShare() == 1.0);
    assert(diesel_only.effectivePvCapacityFactor() == 0.0);
    assert(diesel_only.fuelLitres() > 0.0);

    // Mid-size island with the floor-aware battery check keeps LPSP under 5%
    SimulationInputs medium_in = island(300, 600, 150, 1000000);
    medium_in.params.reserve_aware_dispatch = true;
    const DispatchResult medium = runDispatch(medium_in, climate);
    assert(medium.lpsp() >= 0.0 && medium.lpsp() < 0.05);
    assert(medium.dieselShare() > 0.0 && medium.dieselShare() < 1.0);
    assert(medium.effectivePvCapacityFactor() > 0.0 && medium.effectivePvCapacityFactor() < 1.0);
    assert(medium.avgSoc() > 0.0 && medium.avgSoc() <= 1.0);
    assert(medium.maxDod() <= 1.0);
    assert(medium.batteryWear() > 0.0);
    assert(medium.batteryCycles() == medium.batteryDischargeKwh() / 600.0);

    const auto summary = medium.summary();
    assert(summary.front().first == "pv_kw" && summary.front().second == 300.0);

    // Default (nameplate) check on the same island
    const DispatchResult medium_default = runDispatch(island(300, 600, 150, 1000000), climate);
    assert(medium_default.dieselShare() > 0.0 && medium_default.dieselShare() < 1.0);
    assert(medium_default.lpsp() > 0.05);

    std::cout << "[PASS] Solar-only, diesel-only and mid-size fixtures hold.\n";
}

// Test 19: default dispatch reproduces the reference methodology totals
void test_reference_totals() {
    const ClimateSeries climate = tropical_climate();
    assert(!DispatchParams{}.reserve_aware_dispatch);

    const DispatchResult medium = runDispatch(island(300, 600, 150, 1000000), climate);
    assert(std::fabs(medium.lpsp() - 0.1104573) < 1e-5);
    assert(medium.dieselHours() == 2190);
    assert(medium.unmetHours() == 2190);
    assert(std::fabs(medium.dieselGenerationKwh() - 315766.807) < 0.5);
    assert(std::fabs(medium.fuelLitres() - 104434.960) < 0.5);
    assert(std::fabs(medium.pvGenerationKwh() - 598530.836) < 0.5);
    assert(medium.curtailmentKwh() == 0.0);

    const DispatchResult small = runDispatch(island(50, 100, 30, 200000), climate);
    assert(std::fabs(small.lpsp() - 0.1625820) < 1e-5);
    assert(small.dieselHours() == 2555);
    assert(std::fabs(small.dieselGenerationKwh() - 70716.387) < 0.5);

    std::cout << "[PASS] Default dispatch matches the reference totals.\n";
}

// Test 20: floor-aware availability check runs diesel more and serves more load
void test_reserve_aware_dispatch() {
    const ClimateSeries climate = tropical_climate();
    SimulationInputs in = island(300, 600, 150, 1000000);
    const DispatchResult nameplate = runDispatch(in, climate);

    in.params.reserve_aware_dispatch = true;
    const DispatchResult reserve = runDispatch(in, climate);
    assert(reserve.dieselHours() == 3285);

    assert(nameplate.unmetDemandKwh() > reserve.unmetDemandKwh());
    assert(nameplate.dieselHours() < reserve.dieselHours());

    std::cout << "[PASS] Reserve-aware dispatch serves more load.\n";
}

// Test 21: nothing installed -> every ratio guarded, all demand unmet
void test_zero_denominators() {
    const ClimateSeries climate = tropical_climate();
    const DispatchResult r = runDispatch(island(0, 0, 0, 100000), climate);

    assert(r.effectivePvCapacityFactor() == 0.0);
    assert(r.curtailmentFraction() == 0.0);
    assert(r.dieselShare() == 0.0);
    assert(r.batteryUtilisation() == 0.0);
    assert(r.batteryCycles() == 0.0);
    assert(near(r.lpsp(), 1.0, 1e-6));
    assert(r.unmetHours() == HOURS_PER_YEAR);

    std::cout << "[PASS] Zero denominators yield zero ratios.\n";
}

// Test 22: invalid inputs are rejected up front
void test_input_validation() {
    const ClimateSeries climate = tropical_climate();

    assert(throws<std::invalid_argument>([&] { runDispatch(island(-1, 0, 0, 1000), climate); }));
    assert(throws<std::invalid_argument>([&] { runDispatch(island(0, -1, 0, 1000), climate); }));
    assert(throws<std::invalid_argument>([&] { runDispatch(island(0, 0, -1, 1000), climate); }));
    assert(throws<std::invalid_argument>([&] { runDispatch(island(0, 0, 0, 0), climate); }));
    assert(throws<std::invalid_argument>([&] {
        runDispatch(island(std::nan(""), 0, 0, 1000), climate);
    }));

    SimulationInputs bad_params = island(10, 10, 10, 1000);
    bad_params.params.battery_charge_eff = 1.5;
    assert(throws<std::invalid_argument>([&] { runDispatch(bad_params, climate); }));

    SimulationInputs custom = island(10, 10, 10, 1000);
    DiurnalShape shape{};
    shape[12] = 0.5;
    custom.load_shape = shape;
    assert(throws<std::invalid_argument>([&] { runDispatch(custom, climate); }));
    shape[0] = 0.5;
    custom.load_shape = shape;
    const DispatchResult r = runDispatch(custom, climate);
    assert(r.annualDemandKwh() == 1000.0);

    std::cout << "[PASS] Invalid inputs raise std::invalid_argument.\n";
}

// Test 23: case file parsing
void test_case_file() {
    const fs::path dir = scratch_dir("cases");
    const fs::path path = dir / "cases.txt";
    {
        std::ofstream out(path);
        out << "# name pv battery diesel demand\n";
        out << "Hulhumale 300 600 150 1000000\n";
        out << "\n";
        out << "broken 1 2 three 4\n";
        out << "too_many 1 2 3 4 5\n";
        out << "Addu  1200 2400 600 4e6\n";
    }

    int warnings = 0;
    const auto cases = IsleHelpers::load_cases(path.string(),
        [&](const std::string& msg) { if (msg.rfind("[warn]", 0) == 0) ++warnings; });
    assert(cases.size() == 2);
    assert(cases[0].name == "Hulhumale" && cases[0].diesel_kw == 150.0);
    assert(cases[1].demand_kwh == 4e6);
    assert(warnings == 2);

    assert(throws<std::runtime_error>([&] {
        IsleHelpers::load_cases((dir / "missing.txt").string(), nullptr);
    }));

    assert(IsleHelpers::reference_cases().size() == 6);
    assert(IsleHelpers::sanitize_name("Small island (100 hh)") == "Small_island_100_hh");
    assert(IsleHelpers::sanitize_name("()") == "case");

    char prog[] = "islegrid_sim";
    char a1[] = "--cases";
    char a2[] = "c.txt";
    char a3[] = "--trace";
    char a4[] = "--bogus";
    char* argv[] = {prog, a1, a2, a3, a4};
    const IsleHelpers::Args args = IsleHelpers::parse_args(5, argv);
    assert(args.casesPath == "c.txt" && args.trace && !args.showHelp);
    assert(args.unknown.size() == 1 && args.unknown[0] == "--bogus");

    fs::remove_all(dir);
    std::cout << "[PASS] Case file rows parsed, malformed rows skipped.\n";
}

// Test 24: summary CSV lands under IG_LOG_DIR/RUN_ID
void test_summary_logger() {
    const fs::path dir = scratch_dir("logs");
    setenv("IG_LOG_DIR", dir.string().c_str(), 1);
    setenv("RUN_ID", "unit", 1);
    assert(Logger::output_dir() == dir / "unit");

    const DispatchResult r = runDispatch(island(50, 100, 30, 200000), tropical_climate());
    std::vector<std::string> cols;
    std::vector<double> vals;
    for (const auto& kv : r.summary()) {
        cols.push_back(kv.first);
        vals.push_back(kv.second);
    }
    Logger::instance().log_labeled("DispatchSummary", "small", cols, vals);
    Logger::instance().log_wide("Trace", 0, 0.0, {"soc"}, {0.5});
    Logger::instance().close_all();

    std::ifstream in(dir / "unit" / "DispatchSummary.csv");
    assert(in);
    std::string header, row;
    std::getline(in, header);
    std::getline(in, row);
    assert(header.rfind("label,pv_kw,battery_kwh", 0) == 0);
    assert(row.rfind("small,50,100,30", 0) == 0);

    std::ifstream trace(dir / "unit" / "Trace.csv");
    std::getline(trace, header);
    assert(header == "index,time_h,soc");

    unsetenv("IG_LOG_DIR");
    unsetenv("RUN_ID");
    fs::remove_all(dir);
    std::cout << "[PASS] Summary CSV written under the run directory.\n";
}

int main() {
    test_load_profile();
    test_solar_output();
    test_battery_operations();
    test_battery_zero_capacity();
    test_battery_self_discharge_and_wear();
    test_policy_bands();
    test_policy_decisions();
    test_fuel_curve();
    test_climate_validation();
    test_climate_loader();
    test_parameter_csv();
    test_soc_bounds();
    test_energy_balance();
    test_zero_battery();
    test_zero_diesel();
    test_minimum_load();
    test_determinism();
    test_scenario_fixtures();
    test_reference_totals();
    test_reserve_aware_dispatch();
    test_zero_denominators();
    test_input_validation();
    test_case_file();
    test_summary_logger();
    std::cout << "All tests passed.\n";
    return 0;
}
