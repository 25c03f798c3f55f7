/**
 * @file test_monitor.cpp
 * @brief Unit tests for MockMonitor and LinuxMonitor.
 */

#include "resource_monitor/monitor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace automl_bench;

// ─── MockMonitor ─────────────────────────────

TEST(MockMonitorTest, DefaultReading) {
    MockMonitor monitor;

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cores, 8);
    EXPECT_EQ(result->memory_total_mb, 16 * 1024);
    EXPECT_EQ(result->memory_available_mb, 12 * 1024);
}

TEST(MockMonitorTest, SetCoresAndMemory) {
    MockMonitor monitor;
    monitor.set_cores(2);
    monitor.set_memory(1024, 4096);

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cores, 2);
    EXPECT_EQ(result->memory_available_mb, 1024);
    EXPECT_EQ(result->memory_total_mb, 4096);
    EXPECT_EQ(monitor.cores(), 2);
    EXPECT_EQ(monitor.memory_available_mb(), 1024);
}

TEST(MockMonitorTest, SequenceMode) {
    MockMonitor monitor;
    monitor.push_reading({.cores = 4, .memory_total_mb = 8192, .memory_available_mb = 6000});
    monitor.push_reading({.cores = 4, .memory_total_mb = 8192, .memory_available_mb = 500});

    auto r1 = monitor.read();
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(r1->memory_available_mb, 6000);

    auto r2 = monitor.read();
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r2->memory_available_mb, 500);
    EXPECT_EQ(monitor.memory_available_mb(), 500);

    // Sequence exhausted
    auto r3 = monitor.read();
    EXPECT_FALSE(r3.has_value());
    EXPECT_EQ(monitor.read_count(), 3u);
}

// ─── LinuxMonitor ────────────────────────────

TEST(LinuxMonitorTest, ParsesMeminfo) {
    test_support::TempDir dir;
    auto path = dir.write("meminfo",
                          "MemTotal:       16384000 kB\n"
                          "MemFree:         1024000 kB\n"
                          "MemAvailable:    8192000 kB\n");
    LinuxMonitor monitor(path.string());

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->memory_total_mb, 16000);
    EXPECT_EQ(result->memory_available_mb, 8000);
    EXPECT_GE(result->cores, 1);
}

TEST(LinuxMonitorTest, FallsBackToMemFree) {
    test_support::TempDir dir;
    auto path = dir.write("meminfo",
                          "MemTotal:       4096000 kB\n"
                          "MemFree:        2048000 kB\n");
    LinuxMonitor monitor(path.string());
    EXPECT_EQ(monitor.memory_available_mb(), 2000);
}

TEST(LinuxMonitorTest, MissingFileIsAnError) {
    LinuxMonitor monitor("/nonexistent/meminfo");
    auto result = monitor.read();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
}

TEST(LinuxMonitorTest, ReadsRealProcMeminfo) {
    if (!std::filesystem::exists("/proc/meminfo")) GTEST_SKIP() << "no /proc/meminfo";
    LinuxMonitor monitor;
    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_GT(result->memory_total_mb, 0);
    EXPECT_GE(monitor.cores(), 1);
}
