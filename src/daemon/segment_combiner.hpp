#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct CombinedRecording {
    std::filesystem::path path;
    size_t segments = 0;
    size_t frames = 0;
    uint32_t sample_rate = 0;

    double duration_s() const { return sample_rate ? static_cast<double>(frames) / sample_rate : 0.0; }
};

// Merges a session's segments into <recordings_dir>/<session_id>.wav, then
// deletes the segments and the per-session temp directory.
class SegmentCombiner {
public:
    SegmentCombiner(std::filesystem::path temp_dir, std::filesystem::path recordings_dir);

    // No segments is not an error: returns an empty optional and writes nothing.
    // On error the segments are left in place.
    std::expected<std::optional<CombinedRecording>, std::string>
        combine(const std::string& session_id);

    // segment_NNNN.wav files of a session directory in numeric order.
    static std::vector<std::filesystem::path> list_segments(const std::filesystem::path& session_dir);

private:
    std::filesystem::path temp_dir_;
    std::filesystem::path recordings_dir_;
};
