#include "wav.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

struct Layout {
    Format format;
    size_t data_offset = 0;
    size_t data_size = 0;
};

// Walks the chunk list of a RIFF/WAVE header. `total` may be larger than
// `bytes` when only the head of a file has been read.
std::expected<Layout, std::string> parse_layout(std::span<const uint8_t> bytes, size_t total) {
    if (bytes.size() < 12 ||
        std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Layout layout;
    bool have_fmt = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t size = read_u32(chunk + 4);

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16 || pos + 8 + 16 > bytes.size()) {
                return std::unexpected("truncated fmt chunk");
            }
            const uint8_t* f = chunk + 8;
            if (read_u16(f) != 1) {
                return std::unexpected("unsupported encoding (not PCM)");
            }
            layout.format.channels = read_u16(f + 2);
            layout.format.sample_rate = read_u32(f + 4);
            layout.format.bits_per_sample = read_u16(f + 14);
            if (layout.format.bits_per_sample != 16 || layout.format.channels == 0) {
                return std::unexpected(std::format("unsupported sample layout: {} bit, {} ch",
                                                   layout.format.bits_per_sample,
                                                   layout.format.channels));
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            layout.data_offset = pos + 8;
            layout.data_size = std::min<size_t>(size, total - layout.data_offset);
            return layout;
        }

        // Chunks are word aligned.
        pos += 8 + size + (size & 1);
    }

    return std::unexpected("no data chunk");
}

} // namespace

std::expected<Clip, std::string> decode(std::span<const uint8_t> bytes) {
    auto layout = parse_layout(bytes, bytes.size());
    if (!layout) return std::unexpected(layout.error());

    Clip clip;
    clip.format = layout->format;
    size_t n = layout->data_size / sizeof(int16_t);
    clip.samples.resize(n);
    if (n > 0) {
        std::memcpy(clip.samples.data(), bytes.data() + layout->data_offset, n * sizeof(int16_t));
    }
    return clip;
}

std::expected<std::pair<Format, size_t>, std::string> probe(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f.is_open()) return std::unexpected("cannot open " + path.string());

    auto total = static_cast<size_t>(f.tellg());
    std::vector<uint8_t> head(std::min<size_t>(total, 4096));
    f.seekg(0);
    f.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    if (!f) return std::unexpected("short read on " + path.string());

    auto layout = parse_layout(head, total);
    if (!layout) return std::unexpected(path.string() + ": " + layout.error());

    size_t frames = layout->data_size / layout->format.block_align();
    return std::pair{layout->format, frames};
}

std::expected<Clip, std::string> read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("cannot open " + path.string());

    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    auto clip = decode(bytes);
    if (!clip) return std::unexpected(path.string() + ": " + clip.error());
    return clip;
}

std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                            std::span<const int16_t> samples,
                                            const Format& fmt) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) return std::unexpected("cannot create " + path.string());

    auto bytes = encode(samples, fmt);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f) return std::unexpected("write failed for " + path.string());
    return {};
}

} // namespace wav
