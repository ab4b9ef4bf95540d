#pragma once

#include "vad/vad_engine.hpp"

// Plain RMS gate with the same input constraints as WebRtcVad.
class EnergyVad : public VadEngine {
public:
    // Aggressiveness 0..3; higher values need more energy to count as speech.
    explicit EnergyVad(int aggressiveness = 2);

    bool accepts_rate(uint32_t sample_rate) const override;
    std::expected<bool, std::string>
        classify(std::span<const int16_t> frame, uint32_t sample_rate) override;

    double threshold() const { return threshold_; }

    static double rms(std::span<const int16_t> frame);

private:
    double threshold_;
};
