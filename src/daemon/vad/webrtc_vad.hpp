#pragma once

#include "vad/vad_engine.hpp"

#include <memory>

struct Fvad;

// libfvad (the WebRTC VAD model) behind VadEngine.
class WebRtcVad : public VadEngine {
public:
    WebRtcVad();
    ~WebRtcVad() override;

    WebRtcVad(const WebRtcVad&) = delete;
    WebRtcVad& operator=(const WebRtcVad&) = delete;

    // Aggressiveness 0..3. False if the handle cannot be created or the mode
    // is rejected.
    bool init(int aggressiveness);

    bool accepts_rate(uint32_t sample_rate) const override;
    std::expected<bool, std::string>
        classify(std::span<const int16_t> frame, uint32_t sample_rate) override;

private:
    struct Deleter {
        void operator()(Fvad* vad) const;
    };

    std::unique_ptr<Fvad, Deleter> vad_;
    uint32_t rate_ = 0;
};
