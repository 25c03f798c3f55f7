/**
 * @file linux_monitor.cpp
 * @brief LinuxMonitor — reads core count and memory figures from the
 *        Linux pseudo-filesystem.
 */

#include "resource_monitor/monitor.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace automl_bench {

// ─────────────────────────────────────────────
// Internal helpers for /proc parsing
// ─────────────────────────────────────────────
namespace {

std::vector<std::string> read_file_lines(const std::string& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
    uint64_t free_kb{0};
    bool has_available{false};
};

/**
 * @brief Parse /proc/meminfo.
 * Format: "MemTotal:       16318452 kB"
 */
MemInfo parse_meminfo(const std::string& path) {
    MemInfo info;
    auto lines = read_file_lines(path);
    for (const auto& line : lines) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
            info.has_available = true;
        } else if (line.starts_with("MemFree:")) {
            std::istringstream iss(line.substr(8));
            iss >> info.free_kb;
        }
    }
    // Kernels older than 3.14 do not report MemAvailable.
    if (!info.has_available) info.available_kb = info.free_kb;
    return info;
}

int online_cores() {
    auto n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<int>(n);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// LinuxMonitor implementation
// ─────────────────────────────────────────────

LinuxMonitor::LinuxMonitor(std::string meminfo_path)
    : meminfo_path_(std::move(meminfo_path)) {}

Result<SystemResources> LinuxMonitor::read() {
    auto mem = parse_meminfo(meminfo_path_);
    if (mem.total_kb == 0) {
        return Error{ErrorCode::Io, "Could not read memory figures from " + meminfo_path_};
    }

    SystemResources res;
    res.cores = online_cores();
    res.memory_total_mb = static_cast<int64_t>(mem.total_kb / 1024);
    res.memory_available_mb = static_cast<int64_t>(mem.available_kb / 1024);
    return res;
}

int LinuxMonitor::cores() {
    return online_cores();
}

int64_t LinuxMonitor::memory_available_mb() {
    return static_cast<int64_t>(parse_meminfo(meminfo_path_).available_kb / 1024);
}

}  // namespace automl_bench
