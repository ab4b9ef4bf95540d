#include "resampler.hpp"

#include <algorithm>
#include <cmath>

namespace dsp {

size_t resampled_length(size_t frames, uint32_t from_rate, uint32_t to_rate) {
    if (from_rate == 0 || to_rate == 0) return 0;
    double n = static_cast<double>(frames) * to_rate / from_rate;
    return static_cast<size_t>(std::llround(n));
}

std::vector<int16_t> resample(std::span<const int16_t> samples,
                              uint32_t from_rate, uint32_t to_rate,
                              uint16_t channels) {
    if (from_rate == to_rate) return {samples.begin(), samples.end()};
    if (channels == 0 || from_rate == 0 || to_rate == 0) return {};

    size_t in_frames = samples.size() / channels;
    size_t out_frames = resampled_length(in_frames, from_rate, to_rate);
    if (in_frames == 0 || out_frames == 0) return {};

    std::vector<int16_t> out(out_frames * channels);

    // Positions span [0, in_frames - 1] evenly, endpoints included.
    double step = out_frames > 1
        ? static_cast<double>(in_frames - 1) / static_cast<double>(out_frames - 1)
        : 0.0;

    for (size_t i = 0; i < out_frames; ++i) {
        double pos = step * static_cast<double>(i);
        auto lo = static_cast<size_t>(pos);
        if (lo >= in_frames) lo = in_frames - 1;
        size_t hi = std::min(lo + 1, in_frames - 1);
        double frac = pos - static_cast<double>(lo);

        for (uint16_t c = 0; c < channels; ++c) {
            double a = samples[lo * channels + c];
            double b = samples[hi * channels + c];
            double v = std::round(a + (b - a) * frac);
            out[i * channels + c] = static_cast<int16_t>(std::clamp(v, -32768.0, 32767.0));
        }
    }

    return out;
}

} // namespace dsp
