#include "vad/energy_vad.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace {

constexpr std::array<uint32_t, 4> RATES = {8000, 16000, 32000, 48000};
constexpr std::array<uint32_t, 3> FRAME_MS = {10, 20, 30};
// RMS in int16 units, indexed by aggressiveness.
constexpr std::array<double, 4> THRESHOLDS = {200.0, 350.0, 500.0, 800.0};

} // namespace

EnergyVad::EnergyVad(int aggressiveness)
    : threshold_(THRESHOLDS[static_cast<size_t>(std::clamp(aggressiveness, 0, 3))]) {}

bool EnergyVad::accepts_rate(uint32_t sample_rate) const {
    return std::ranges::find(RATES, sample_rate) != RATES.end();
}

std::expected<bool, std::string>
EnergyVad::classify(std::span<const int16_t> frame, uint32_t sample_rate) {
    if (!accepts_rate(sample_rate)) {
        return std::unexpected(std::format("unsupported sample rate {}", sample_rate));
    }

    bool valid_length = std::ranges::any_of(FRAME_MS, [&](uint32_t ms) {
        return frame.size() == static_cast<size_t>(sample_rate) * ms / 1000;
    });
    if (!valid_length) {
        return std::unexpected(std::format("invalid frame length {} at {}Hz",
                                           frame.size(), sample_rate));
    }

    return rms(frame) >= threshold_;
}

double EnergyVad::rms(std::span<const int16_t> frame) {
    if (frame.empty()) return 0.0;
    double sum = 0.0;
    for (int16_t s : frame) {
        double v = s;
        sum += v * v;
    }
    return std::sqrt(sum / static_cast<double>(frame.size()));
}
