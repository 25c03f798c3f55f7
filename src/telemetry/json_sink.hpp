/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: file, stdout and null.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace automl_bench {

/**
 * @brief Appends NDJSON lines to `<log_dir>/<prefix>.ndjson`.
 *
 * Optionally mirrors every line to stdout so a console run still shows
 * progress while the file keeps the full history.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 bool mirror_stdout = false);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream file_;
    bool mirror_stdout_;
};

/**
 * @brief Writes to stdout — useful for development/debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace automl_bench
