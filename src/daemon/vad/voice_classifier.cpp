#include "vad/voice_classifier.hpp"

#include "resampler.hpp"

#include <print>

VoiceActivityClassifier::VoiceActivityClassifier(VadEngine& engine, uint32_t frame_ms,
                                                 uint16_t channels)
    : engine_(engine), frame_ms_(frame_ms), channels_(channels ? channels : 1) {}

std::vector<int16_t> VoiceActivityClassifier::prepare_frame(std::span<const int16_t> buffer,
                                                            uint32_t actual_rate,
                                                            uint32_t& frame_rate) const {
    std::vector<int16_t> mono;
    if (channels_ == 1) {
        mono.assign(buffer.begin(), buffer.end());
    } else {
        size_t frames = buffer.size() / channels_;
        mono.resize(frames);
        for (size_t i = 0; i < frames; ++i) {
            int sum = 0;
            for (uint16_t c = 0; c < channels_; ++c) sum += buffer[i * channels_ + c];
            mono[i] = static_cast<int16_t>(sum / channels_);
        }
    }

    frame_rate = actual_rate;
    if (!engine_.accepts_rate(actual_rate)) {
        mono = dsp::resample(mono, actual_rate, CANONICAL_RATE);
        frame_rate = CANONICAL_RATE;
    }

    mono.resize(static_cast<size_t>(frame_rate) * frame_ms_ / 1000, 0);
    return mono;
}

bool VoiceActivityClassifier::is_speech(std::span<const int16_t> buffer, uint32_t actual_rate) {
    uint32_t rate = 0;
    auto frame = prepare_frame(buffer, actual_rate, rate);

    auto verdict = engine_.classify(frame, rate);
    if (!verdict) return fail_open(verdict.error());
    return *verdict;
}

bool VoiceActivityClassifier::fail_open(const std::string& reason) {
    if (fallback_count_++ % 100 == 0) {
        std::println(stderr, "vad: classifier error ({}), treating buffer as speech [{} so far]",
                     reason, fallback_count_);
    }
    return true;
}
