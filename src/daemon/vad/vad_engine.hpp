#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

// Frame-level speech detector with WebRTC-style input constraints:
// mono int16 at one of a few fixed rates, frames of exactly 10, 20 or 30 ms.
class VadEngine {
public:
    virtual ~VadEngine() = default;
    virtual bool accepts_rate(uint32_t sample_rate) const = 0;
    // Errors on an unsupported rate or frame length.
    virtual std::expected<bool, std::string>
        classify(std::span<const int16_t> frame, uint32_t sample_rate) = 0;
};
