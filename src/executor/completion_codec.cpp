/**
 * @file completion_codec.cpp
 * @brief CompletionCodec binary serialization for process-isolated jobs.
 *
 * Wire format (all multi-byte values are big-endian, doubles as IEEE-754 bits,
 * strings as [4B len][bytes]):
 *
 *   [1B state][8B duration]
 *   [1B has_error]([str error])
 *   [1B has_result]([result])
 *
 * Result:
 *   [str id][str task][str framework][4B fold][8B seed]
 *   [8B duration][str utc][4B models_count]
 *   [1B outcome: 0=scored, 1=no result]
 *   scored:    [4B count]([str metric][8B value])*
 *   no result: [str info]
 */

#include "executor/completion_codec.hpp"

#include <bit>

namespace automl_bench {

namespace {

/// Bounds-checked cursor over an encoded payload.
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data) {}

    bool u8(uint8_t& out) {
        if (!need(1)) return false;
        out = data_[offset_++];
        return true;
    }

    bool u32(uint32_t& out) {
        if (!need(4)) return false;
        out = CompletionCodec::get_u32(data_.data() + offset_);
        offset_ += 4;
        return true;
    }

    bool u64(uint64_t& out) {
        if (!need(8)) return false;
        out = CompletionCodec::get_u64(data_.data() + offset_);
        offset_ += 8;
        return true;
    }

    bool f64(double& out) {
        uint64_t bits = 0;
        if (!u64(bits)) return false;
        out = std::bit_cast<double>(bits);
        return true;
    }

    bool str(std::string& out) {
        uint32_t len = 0;
        if (!u32(len) || !need(len)) return false;
        out.assign(reinterpret_cast<const char*>(data_.data() + offset_), len);
        offset_ += len;
        return true;
    }

    [[nodiscard]] bool at_end() const noexcept { return offset_ == data_.size(); }

private:
    bool need(size_t n) const noexcept { return offset_ + n <= data_.size(); }

    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
};

void encode_result(std::vector<uint8_t>& buf, const TaskResult& result) {
    CompletionCodec::put_str(buf, result.identity.id);
    CompletionCodec::put_str(buf, result.identity.task);
    CompletionCodec::put_str(buf, result.identity.framework);
    CompletionCodec::put_u32(buf, static_cast<uint32_t>(result.identity.fold));
    CompletionCodec::put_u64(buf, result.identity.seed);
    CompletionCodec::put_f64(buf, result.duration);
    CompletionCodec::put_str(buf, result.utc);
    CompletionCodec::put_u32(buf, result.models_count);

    if (const auto* scored = std::get_if<Scored>(&result.outcome)) {
        buf.push_back(0x00);
        CompletionCodec::put_u32(buf, static_cast<uint32_t>(scored->scores.size()));
        for (const auto& score : scored->scores) {
            CompletionCodec::put_str(buf, score.metric);
            CompletionCodec::put_f64(buf, score.value);
        }
    } else {
        buf.push_back(0x01);
        CompletionCodec::put_str(buf, std::get<NoResult>(result.outcome).info);
    }
}

bool decode_result(Reader& in, TaskResult& result) {
    uint32_t fold = 0;
    uint8_t kind = 0;
    if (!in.str(result.identity.id) || !in.str(result.identity.task)
        || !in.str(result.identity.framework) || !in.u32(fold)
        || !in.u64(result.identity.seed) || !in.f64(result.duration)
        || !in.str(result.utc) || !in.u32(result.models_count) || !in.u8(kind)) {
        return false;
    }
    result.identity.fold = static_cast<int>(fold);

    if (kind == 0x00) {
        uint32_t count = 0;
        if (!in.u32(count)) return false;
        Scored scored;
        for (uint32_t i = 0; i < count; ++i) {
            MetricScore score{};
            if (!in.str(score.metric) || !in.f64(score.value)) return false;
            scored.scores.push_back(std::move(score));
        }
        result.outcome = std::move(scored);
        return true;
    }
    if (kind == 0x01) {
        NoResult none;
        if (!in.str(none.info)) return false;
        result.outcome = std::move(none);
        return true;
    }
    return false;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void CompletionCodec::put_u64(std::vector<uint8_t>& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void CompletionCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

void CompletionCodec::put_f64(std::vector<uint8_t>& buf, double val) {
    put_u64(buf, std::bit_cast<uint64_t>(val));
}

void CompletionCodec::put_str(std::vector<uint8_t>& buf, const std::string& val) {
    put_u32(buf, static_cast<uint32_t>(val.size()));
    buf.insert(buf.end(), val.begin(), val.end());
}

uint64_t CompletionCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

uint32_t CompletionCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

// ─────────────────────────────────────────────
// Completion
// ─────────────────────────────────────────────

std::vector<uint8_t> CompletionCodec::encode(const JobCompletion& completion) {
    std::vector<uint8_t> buf;
    buf.reserve(128);

    buf.push_back(static_cast<uint8_t>(completion.state));
    put_f64(buf, completion.duration);

    buf.push_back(completion.error ? 0x01 : 0x00);
    if (completion.error) put_str(buf, *completion.error);

    buf.push_back(completion.result ? 0x01 : 0x00);
    if (completion.result) encode_result(buf, *completion.result);

    return buf;
}

bool CompletionCodec::decode(const std::vector<uint8_t>& data, JobCompletion& completion) {
    Reader in(data);
    uint8_t state = 0;
    uint8_t has_error = 0;
    uint8_t has_result = 0;

    if (!in.u8(state) || state > static_cast<uint8_t>(JobState::Failed)) return false;
    completion.state = static_cast<JobState>(state);
    if (!in.f64(completion.duration)) return false;

    if (!in.u8(has_error)) return false;
    completion.error.reset();
    if (has_error) {
        std::string error;
        if (!in.str(error)) return false;
        completion.error = std::move(error);
    }

    if (!in.u8(has_result)) return false;
    completion.result.reset();
    if (has_result) {
        TaskResult result;
        if (!decode_result(in, result)) return false;
        completion.result = std::move(result);
    }

    return in.at_end();
}

}  // namespace automl_bench
