#pragma once

#include "vad/vad_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

// Adapts arbitrary capture buffers to the engine's constraints: downmixes to
// mono, resamples to 16 kHz when the engine rejects the capture rate, then
// pads with silence or truncates to exactly one engine frame.
class VoiceActivityClassifier {
public:
    static constexpr uint32_t CANONICAL_RATE = 16000;

    VoiceActivityClassifier(VadEngine& engine, uint32_t frame_ms = 30, uint16_t channels = 1);

    bool is_speech(std::span<const int16_t> buffer, uint32_t actual_rate);

    // Exact engine frame for `buffer` at `actual_rate`, and the rate it is at.
    std::vector<int16_t> prepare_frame(std::span<const int16_t> buffer, uint32_t actual_rate,
                                       uint32_t& frame_rate) const;

    size_t fallback_count() const { return fallback_count_; }

private:
    // Engine failures report speech so the buffer is kept. Product decision,
    // do not invert.
    bool fail_open(const std::string& reason);

    VadEngine& engine_;
    uint32_t frame_ms_;
    uint16_t channels_;
    size_t fallback_count_ = 0;
};
