#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

using AudioBuffer = std::vector<int16_t>;

struct SegmentationPolicy {
    size_t min_chunks = 50;
    size_t max_chunks = 500;
    size_t silence_chunks = 10;

    // Hard cap on run length, or a long enough run followed by a pause.
    bool should_flush(size_t run_length, size_t silence_streak) const {
        if (run_length >= max_chunks) return true;
        return run_length >= min_chunks && silence_streak >= silence_chunks;
    }
};

// Buffers read since the last flush, in read order.
class AccumulatedRun {
public:
    void push(AudioBuffer buffer, bool is_speech) {
        buffers_.push_back(std::move(buffer));
        silence_streak_ = is_speech ? 0 : silence_streak_ + 1;
    }

    // Hands the buffers over and resets the run.
    std::vector<AudioBuffer> take() {
        silence_streak_ = 0;
        return std::exchange(buffers_, {});
    }

    std::span<const AudioBuffer> buffers() const { return buffers_; }
    size_t size() const { return buffers_.size(); }
    bool empty() const { return buffers_.empty(); }
    size_t silence_streak() const { return silence_streak_; }

private:
    std::vector<AudioBuffer> buffers_;
    size_t silence_streak_ = 0;
};
