#include "vad/webrtc_vad.hpp"

#include <fvad.h>

#include <format>
#include <print>

void WebRtcVad::Deleter::operator()(Fvad* vad) const {
    fvad_free(vad);
}

WebRtcVad::WebRtcVad() = default;
WebRtcVad::~WebRtcVad() = default;

bool WebRtcVad::init(int aggressiveness) {
    vad_.reset(fvad_new());
    if (!vad_) {
        std::println(stderr, "vad: fvad_new failed");
        return false;
    }
    if (fvad_set_mode(vad_.get(), aggressiveness) != 0) {
        std::println(stderr, "vad: invalid aggressiveness {}", aggressiveness);
        vad_.reset();
        return false;
    }
    rate_ = 0;
    return true;
}

bool WebRtcVad::accepts_rate(uint32_t sample_rate) const {
    return sample_rate == 8000 || sample_rate == 16000 ||
           sample_rate == 32000 || sample_rate == 48000;
}

std::expected<bool, std::string>
WebRtcVad::classify(std::span<const int16_t> frame, uint32_t sample_rate) {
    if (!vad_) return std::unexpected("vad not initialized");
    if (!accepts_rate(sample_rate)) {
        return std::unexpected(std::format("unsupported sample rate {}", sample_rate));
    }

    if (sample_rate != rate_) {
        if (fvad_set_sample_rate(vad_.get(), static_cast<int>(sample_rate)) != 0) {
            return std::unexpected(std::format("fvad rejected sample rate {}", sample_rate));
        }
        rate_ = sample_rate;
    }

    int verdict = fvad_process(vad_.get(), frame.data(), frame.size());
    if (verdict < 0) {
        return std::unexpected(std::format("invalid frame length {} at {}Hz",
                                           frame.size(), sample_rate));
    }
    return verdict == 1;
}
