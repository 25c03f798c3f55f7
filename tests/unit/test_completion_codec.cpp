/**
 * @file test_completion_codec.cpp
 * @brief Unit tests for the worker-process completion payload.
 */

#include "executor/completion_codec.hpp"

#include <gtest/gtest.h>
#include <cmath>

using namespace automl_bench;

namespace {

TaskResult scored_result() {
    TaskResult result;
    result.identity = {.id = "openml.org/t/59", .task = "iris", .framework = "constantpredictor",
                       .fold = 3, .seed = 42};
    result.duration = std::nan("");
    result.utc = "2024-05-01T10:00:00";
    result.models_count = 1;
    result.outcome = Scored{{{"acc", 0.5}, {"balacc", std::nan("")}}};
    return result;
}

}  // namespace

TEST(CompletionCodecTest, BigEndianIntegers) {
    std::vector<uint8_t> buf;
    CompletionCodec::put_u32(buf, 0x01020304u);
    EXPECT_EQ(buf, (std::vector<uint8_t>{1, 2, 3, 4}));
    EXPECT_EQ(CompletionCodec::get_u32(buf.data()), 0x01020304u);

    buf.clear();
    CompletionCodec::put_u64(buf, 0x0102030405060708ull);
    EXPECT_EQ(buf.front(), 1);
    EXPECT_EQ(buf.back(), 8);
    EXPECT_EQ(CompletionCodec::get_u64(buf.data()), 0x0102030405060708ull);
}

TEST(CompletionCodecTest, ScoredCompletion) {
    JobCompletion sent{.state = JobState::Completed, .duration = 1.25, .result = scored_result()};
    auto payload = CompletionCodec::encode(sent);

    JobCompletion received;
    received.key = JobKey{.task = "iris", .fold = 3, .framework = "constantpredictor"};
    ASSERT_TRUE(CompletionCodec::decode(payload, received));

    EXPECT_EQ(received.key.task, "iris");
    EXPECT_EQ(received.state, JobState::Completed);
    EXPECT_DOUBLE_EQ(received.duration, 1.25);
    EXPECT_FALSE(received.error.has_value());
    ASSERT_TRUE(received.result.has_value());

    const auto& r = *received.result;
    EXPECT_EQ(r.identity.id, "openml.org/t/59");
    EXPECT_EQ(r.identity.fold, 3);
    EXPECT_EQ(r.identity.seed, 42u);
    EXPECT_TRUE(std::isnan(r.duration));
    EXPECT_EQ(r.utc, "2024-05-01T10:00:00");
    EXPECT_EQ(r.models_count, 1u);

    const auto& scores = std::get<Scored>(r.outcome).scores;
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_EQ(scores[0].metric, "acc");
    EXPECT_DOUBLE_EQ(scores[0].value, 0.5);
    EXPECT_TRUE(std::isnan(scores[1].value));
}

TEST(CompletionCodecTest, NoResultCompletion) {
    auto result = scored_result();
    result.outcome = NoResult{"Error: boom"};
    JobCompletion sent{.state = JobState::Completed, .duration = 0.1, .result = result};

    JobCompletion received;
    ASSERT_TRUE(CompletionCodec::decode(CompletionCodec::encode(sent), received));
    ASSERT_TRUE(received.result.has_value());
    EXPECT_EQ(received.result->info(), "Error: boom");
}

TEST(CompletionCodecTest, FailedCompletionWithoutResult) {
    JobCompletion sent{.state = JobState::Failed, .duration = 0.0, .error = "No dataset for task 404"};

    JobCompletion received;
    ASSERT_TRUE(CompletionCodec::decode(CompletionCodec::encode(sent), received));
    EXPECT_EQ(received.state, JobState::Failed);
    EXPECT_EQ(received.error, "No dataset for task 404");
    EXPECT_FALSE(received.result.has_value());
}

TEST(CompletionCodecTest, TruncatedPayloadIsRejected) {
    JobCompletion sent{.state = JobState::Completed, .duration = 2.0, .result = scored_result()};
    auto payload = CompletionCodec::encode(sent);

    for (size_t cut : {size_t{0}, size_t{5}, payload.size() / 2, payload.size() - 1}) {
        std::vector<uint8_t> partial(payload.begin(), payload.begin() + static_cast<long>(cut));
        JobCompletion received;
        EXPECT_FALSE(CompletionCodec::decode(partial, received)) << "cut at " << cut;
    }
}

TEST(CompletionCodecTest, TrailingBytesAreRejected) {
    JobCompletion sent{.state = JobState::Failed, .error = "x"};
    auto payload = CompletionCodec::encode(sent);
    payload.push_back(0);
    JobCompletion received;
    EXPECT_FALSE(CompletionCodec::decode(payload, received));
}

TEST(CompletionCodecTest, UnknownStateIsRejected) {
    JobCompletion sent{.state = JobState::Completed};
    auto payload = CompletionCodec::encode(sent);
    payload[0] = 0x7f;
    JobCompletion received;
    EXPECT_FALSE(CompletionCodec::decode(payload, received));
}
