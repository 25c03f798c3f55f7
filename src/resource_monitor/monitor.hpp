/**
 * @file monitor.hpp
 * @brief System probe interface and concrete implementations.
 *
 * Provides LinuxMonitor (reads /proc/meminfo and the online core count) and
 * MockMonitor (testing). Both satisfy SystemProbeLike and derive from
 * ISystemProbe so the executor can take either at runtime.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace automl_bench {

/**
 * @brief Abstract source of live machine capacity.
 */
class ISystemProbe {
public:
    virtual ~ISystemProbe() = default;

    virtual Result<SystemResources> read() = 0;
    virtual int cores() = 0;
    virtual int64_t memory_available_mb() = 0;
};

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

/**
 * @brief Reads system resources from Linux pseudo-filesystems.
 *
 * Every call reads fresh values; nothing is cached between jobs.
 *
 * Data sources:
 *   /proc/meminfo                — MemTotal and MemAvailable
 *   std::thread::hardware_concurrency — online cores
 */
class LinuxMonitor : public ISystemProbe {
public:
    explicit LinuxMonitor(std::string meminfo_path = "/proc/meminfo");

    Result<SystemResources> read() override;
    int cores() override;
    int64_t memory_available_mb() override;

private:
    std::string meminfo_path_;
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Mock system probe for testing.
 *
 * Returns a static reading, or a predetermined sequence (one entry per
 * read) once push_reading() has been used.
 */
class MockMonitor : public ISystemProbe {
public:
    MockMonitor();

    Result<SystemResources> read() override;
    int cores() override;
    int64_t memory_available_mb() override;

    // Test helpers
    void set_cores(int cores);
    void set_memory(int64_t available_mb, int64_t total_mb);
    void push_reading(SystemResources reading);
    [[nodiscard]] size_t read_count() const;

private:
    mutable std::mutex mutex_;
    SystemResources static_reading_;
    std::vector<SystemResources> sequence_;
    size_t index_{0};
    size_t reads_{0};
    bool use_static_{true};
};

// Verify concept satisfaction at compile time
static_assert(SystemProbeLike<LinuxMonitor>);
static_assert(SystemProbeLike<MockMonitor>);

}  // namespace automl_bench
