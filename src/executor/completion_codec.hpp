/**
 * @file completion_codec.hpp
 * @brief Binary encoding of a JobCompletion sent from a worker process.
 */

#pragma once

#include "benchmark/job.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace automl_bench {

/**
 * @brief Serializes the outcome of a job run in a child process.
 *
 * The job key is not part of the payload: the parent already knows which
 * job a pipe belongs to and keeps the key it submitted.
 */
struct CompletionCodec {
    static std::vector<uint8_t> encode(const JobCompletion& completion);

    /// Fills every field of `completion` except `key`; false on a malformed payload.
    static bool decode(const std::vector<uint8_t>& data, JobCompletion& completion);

    static void put_u64(std::vector<uint8_t>& buf, uint64_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static void put_f64(std::vector<uint8_t>& buf, double val);
    static void put_str(std::vector<uint8_t>& buf, const std::string& val);
    static uint64_t get_u64(const uint8_t* p);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace automl_bench
