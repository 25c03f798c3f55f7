/**
 * @file mock_monitor.cpp
 * @brief MockMonitor implementation — configurable readings for testing.
 */

#include "resource_monitor/monitor.hpp"

namespace automl_bench {

MockMonitor::MockMonitor() {
    // Sensible defaults resembling a small benchmark box
    static_reading_.cores = 8;
    static_reading_.memory_total_mb = 16 * 1024;
    static_reading_.memory_available_mb = 12 * 1024;
}

Result<SystemResources> MockMonitor::read() {
    std::lock_guard lock(mutex_);
    ++reads_;
    if (use_static_) {
        return static_reading_;
    }
    if (index_ >= sequence_.size()) {
        return Error{ErrorCode::Io, "Mock sequence exhausted"};
    }
    return sequence_[index_++];
}

int MockMonitor::cores() {
    std::lock_guard lock(mutex_);
    return use_static_ ? static_reading_.cores
                       : (index_ > 0 ? sequence_[index_ - 1].cores : 0);
}

int64_t MockMonitor::memory_available_mb() {
    std::lock_guard lock(mutex_);
    return use_static_ ? static_reading_.memory_available_mb
                       : (index_ > 0 ? sequence_[index_ - 1].memory_available_mb : 0);
}

void MockMonitor::set_cores(int cores) {
    std::lock_guard lock(mutex_);
    static_reading_.cores = cores;
}

void MockMonitor::set_memory(int64_t available_mb, int64_t total_mb) {
    std::lock_guard lock(mutex_);
    static_reading_.memory_available_mb = available_mb;
    static_reading_.memory_total_mb = total_mb;
}

void MockMonitor::push_reading(SystemResources reading) {
    std::lock_guard lock(mutex_);
    use_static_ = false;
    sequence_.push_back(reading);
}

size_t MockMonitor::read_count() const {
    std::lock_guard lock(mutex_);
    return reads_;
}

}  // namespace automl_bench
