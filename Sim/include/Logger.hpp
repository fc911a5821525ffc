#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <fstream>
#include <string>
#include <vector>

// CSV data logger. One file per stream name under the run directory:
//   $IG_LOG_DIR[/$RUN_ID], else <PROJECT_SOURCE_DIR>/data/raw[/$RUN_ID],
//   else ./data/raw[/$RUN_ID].
// The header is written when a stream is first opened.
class Logger {
public:
    static Logger& instance();
    ~Logger();

    // Wide format: index,time_h,<columns...>
    void log_wide(const std::string& stream,
                  int index, double time_h,
                  const std::vector<std::string>& columns,
                  const std::vector<double>& values);

    // Labelled rows: label,<columns...>
    void log_labeled(const std::string& stream,
                     const std::string& label,
                     const std::vector<std::string>& columns,
                     const std::vector<double>& values);

    // Flush and close every open stream. A later call reopens (truncates).
    void close_all();

    // Directory the next newly opened stream will be written to.
    static std::filesystem::path output_dir();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mtx_;
    std::map<std::string, std::ofstream> streams_;
};
