// Sim/src/Logger.cpp
#include "Logger.hpp"

#include <cstdlib>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace {
namespace fs = std::filesystem;

// Open a fresh CSV under the run directory and write its header.
// Throws std::runtime_error when the directory or file cannot be created.
std::ofstream open_stream(const std::string& stream,
                          const std::string& key_header,
                          const std::vector<std::string>& columns) {
    fs::path base_dir = Logger::output_dir();
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        throw std::runtime_error(
            "Logger: failed to create log directory " + base_dir.string() +
            " : " + ec.message()
        );
    }

    fs::path csv_path = base_dir / (stream + ".csv");
    std::ofstream out(csv_path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(
            "Logger: failed to open log file " + csv_path.string()
        );
    }

    // Enough digits that a logged double reads back to the same value.
    out << std::setprecision(std::numeric_limits<double>::max_digits10);

    out << key_header;
    for (const auto& c : columns) {
        out << ',' << c;
    }
    out << '\n';
    return out;
}

} // anonymous namespace

// ---------------- Logger public API ----------------

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    close_all();
}

fs::path Logger::output_dir() {
    fs::path base;

    // 1) explicit override
    const char* env = std::getenv("IG_LOG_DIR");
    if (env && *env) {
        base = fs::path(env);
    } else {
#ifdef PROJECT_SOURCE_DIR
        // 2) project source dir if available
        base = fs::path(PROJECT_SOURCE_DIR) / "data" / "raw";
#else
        // 3) fallback to current working directory
        base = fs::current_path() / "data" / "raw";
#endif
    }

    // Each RUN_ID gets its own folder, e.g. data/raw/maldives_base/DispatchSummary.csv
    if (const char* run = std::getenv("RUN_ID")) {
        if (*run) base /= run;
    }
    return base;
}

void Logger::log_wide(const std::string& stream,
                      int index, double time_h,
                      const std::vector<std::string>& cols,
                      const std::vector<double>& vals) {
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        it = streams_.emplace(stream, open_stream(stream, "index,time_h", cols)).first;
    }
    std::ofstream& out = it->second;

    out << index << ',' << time_h;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        double v = (i < vals.size() ? vals[i] : 0.0);
        out << ',' << v;
    }
    out << '\n';
}

void Logger::log_labeled(const std::string& stream,
                         const std::string& label,
                         const std::vector<std::string>& cols,
                         const std::vector<double>& vals) {
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        it = streams_.emplace(stream, open_stream(stream, "label", cols)).first;
    }
    std::ofstream& out = it->second;

    out << label;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        double v = (i < vals.size() ? vals[i] : 0.0);
        out << ',' << v;
    }
    out << '\n';
    out.flush();
}

void Logger::close_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& kv : streams_) {
        if (kv.second.is_open()) {
            kv.second.flush();
            kv.second.close();
        }
    }
    streams_.clear();
}
