#include "segment_combiner.hpp"

#include "wav.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <print>

namespace fs = std::filesystem;

namespace {

// "segment_0042.wav" -> 42
std::optional<int> segment_number(const fs::path& p) {
    constexpr std::string_view prefix = "segment_";
    auto name = p.filename().string();
    if (p.extension() != ".wav" || !name.starts_with(prefix)) return std::nullopt;

    auto digits = std::string_view(name).substr(prefix.size(), name.size() - prefix.size() - 4);
    int n = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty()) return std::nullopt;
    return n;
}

} // namespace

SegmentCombiner::SegmentCombiner(fs::path temp_dir, fs::path recordings_dir)
    : temp_dir_(std::move(temp_dir)), recordings_dir_(std::move(recordings_dir)) {}

std::vector<fs::path> SegmentCombiner::list_segments(const fs::path& session_dir) {
    std::vector<std::pair<int, fs::path>> numbered;
    std::error_code ec;
    for (auto it = fs::directory_iterator(session_dir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        if (auto n = segment_number(it->path())) numbered.emplace_back(*n, it->path());
    }
    std::ranges::sort(numbered, {}, &std::pair<int, fs::path>::first);

    std::vector<fs::path> out;
    out.reserve(numbered.size());
    for (auto& [n, p] : numbered) out.push_back(std::move(p));
    return out;
}

std::expected<std::optional<CombinedRecording>, std::string>
SegmentCombiner::combine(const std::string& session_id) {
    auto session_dir = temp_dir_ / session_id;
    auto segments = list_segments(session_dir);
    if (segments.empty()) return std::nullopt;

    // Validate every segment before writing anything.
    auto first = wav::probe(segments.front());
    if (!first) return std::unexpected(first.error());
    const wav::Format fmt = first->first;

    size_t total_frames = 0;
    for (auto& seg : segments) {
        auto info = wav::probe(seg);
        if (!info) return std::unexpected(info.error());
        if (info->first != fmt) {
            return std::unexpected(std::format("{}: format differs from {}",
                                               seg.string(), segments.front().string()));
        }
        total_frames += info->second;
    }

    uint64_t data_size = static_cast<uint64_t>(total_frames) * fmt.block_align();
    if (data_size > std::numeric_limits<uint32_t>::max() - 36) {
        return std::unexpected("combined recording exceeds the WAV size limit");
    }

    std::error_code ec;
    fs::create_directories(recordings_dir_, ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", recordings_dir_.string(), ec.message()));
    }

    auto out_path = recordings_dir_ / (session_id + ".wav");
    {
        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return std::unexpected("cannot create " + out_path.string());

        auto hdr = wav::header(fmt, static_cast<uint32_t>(data_size));
        out.write(reinterpret_cast<const char*>(hdr.data()), static_cast<std::streamsize>(hdr.size()));

        for (auto& seg : segments) {
            auto clip = wav::read_file(seg);
            if (!clip) {
                out.close();
                fs::remove(out_path, ec);
                return std::unexpected(clip.error());
            }
            out.write(reinterpret_cast<const char*>(clip->samples.data()),
                      static_cast<std::streamsize>(clip->samples.size() * sizeof(int16_t)));
        }

        out.flush();
        if (!out) {
            out.close();
            fs::remove(out_path, ec);
            return std::unexpected("write failed for " + out_path.string());
        }
    }

    for (auto& seg : segments) {
        if (!fs::remove(seg, ec) && ec) {
            std::println(stderr, "capture: could not delete {}: {}", seg.string(), ec.message());
        }
    }
    // Only succeeds when empty; a directory that is already gone is fine.
    fs::remove(session_dir, ec);

    return CombinedRecording{
        .path = out_path,
        .segments = segments.size(),
        .frames = total_frames,
        .sample_rate = fmt.sample_rate,
    };
}
