#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <utility>
#include <vector>

// PCM WAV container helpers (16-bit integer samples).
namespace wav {

struct Format {
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
    uint16_t bits_per_sample = 16;

    uint16_t block_align() const { return static_cast<uint16_t>(channels * bits_per_sample / 8); }
    uint32_t byte_rate() const { return sample_rate * block_align(); }

    bool operator==(const Format&) const = default;
};

struct Clip {
    Format format;
    std::vector<int16_t> samples; // interleaved

    size_t frames() const { return format.channels ? samples.size() / format.channels : 0; }
};

inline constexpr size_t HEADER_SIZE = 44;

// Canonical 44-byte header for `data_size` bytes of PCM payload.
inline std::vector<uint8_t> header(const Format& fmt, uint32_t data_size) {
    std::vector<uint8_t> out(HEADER_SIZE);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(fmt.channels);
    w32(fmt.sample_rate);
    w32(fmt.byte_rate());
    w16(fmt.block_align());
    w16(fmt.bits_per_sample);
    w("data", 4);
    w32(data_size);
    return out;
}

// Encodes raw PCM int16 samples into a WAV file in memory.
inline std::vector<uint8_t> encode(std::span<const int16_t> samples, const Format& fmt) {
    auto data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    auto out = header(fmt, data_size);
    out.resize(HEADER_SIZE + data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + HEADER_SIZE, samples.data(), data_size);
    }
    return out;
}

// Parses a RIFF/WAVE buffer. Chunks other than "fmt " and "data" are skipped.
std::expected<Clip, std::string> decode(std::span<const uint8_t> bytes);

// Reads only the format and the frame count without loading samples.
std::expected<std::pair<Format, size_t>, std::string> probe(const std::filesystem::path& path);

std::expected<Clip, std::string> read_file(const std::filesystem::path& path);

// Fails if the file cannot be created or fully written.
std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                            std::span<const int16_t> samples,
                                            const Format& fmt);

} // namespace wav
