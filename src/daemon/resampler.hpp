#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace dsp {

// Linear-interpolation resampler for interleaved int16 PCM.
// Output frame count is round(frames * to_rate / from_rate); each output
// frame is interpolated between the two nearest input frames at evenly
// spaced positions across the input. Channels are interpolated separately.
// Returns the input unchanged when from_rate == to_rate.
std::vector<int16_t> resample(std::span<const int16_t> samples,
                              uint32_t from_rate, uint32_t to_rate,
                              uint16_t channels = 1);

// Number of frames resample() produces for `frames` input frames.
size_t resampled_length(size_t frames, uint32_t from_rate, uint32_t to_rate);

} // namespace dsp
