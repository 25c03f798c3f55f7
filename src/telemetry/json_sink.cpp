/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>

namespace automl_bench {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           bool mirror_stdout)
    : path_(log_dir / (prefix + ".ndjson"))
    , mirror_stdout_(mirror_stdout) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    file_.open(path_, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void JsonFileSink::write(std::string_view json_line) {
    if (file_.is_open()) {
        file_ << json_line << '\n';
    }
    if (mirror_stdout_) {
        std::cout << json_line << '\n';
    }
}

void JsonFileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
    if (mirror_stdout_) {
        std::cout.flush();
    }
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

}  // namespace automl_bench
