#include "segment_writer.hpp"

#include "resampler.hpp"
#include "wav.hpp"

#include <format>

namespace fs = std::filesystem;

SegmentWriter::SegmentWriter(SessionInfo session, fs::path temp_dir, EventPublisher& events)
    : session_(std::move(session)), temp_dir_(std::move(temp_dir)), events_(events) {}

fs::path SegmentWriter::segment_path(const fs::path& session_dir, int segment_num) {
    return session_dir / std::format("segment_{:04}.wav", segment_num);
}

fs::path SegmentWriter::segment_path(int segment_num) const {
    return segment_path(session_dir(), segment_num);
}

std::expected<fs::path, std::string>
SegmentWriter::save(std::span<const AudioBuffer> buffers, int segment_num) {
    if (segment_num <= last_segment_) {
        return std::unexpected(std::format("segment {} out of order (last written {})",
                                           segment_num, last_segment_));
    }

    auto path = segment_path(segment_num);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return std::unexpected("refusing to overwrite " + path.string());
    }
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", path.parent_path().string(), ec.message()));
    }

    size_t total = 0;
    for (auto& b : buffers) total += b.size();

    std::vector<int16_t> pcm;
    pcm.reserve(total);
    for (auto& b : buffers) pcm.insert(pcm.end(), b.begin(), b.end());

    // Resample the whole run at once so buffer boundaries add no error.
    if (session_.needs_resampling()) {
        pcm = dsp::resample(pcm, session_.capture_rate, session_.target_rate, session_.channels);
    }

    wav::Format fmt{.sample_rate = session_.target_rate, .channels = session_.channels};
    auto written = wav::write_file(path, pcm, fmt);
    if (!written) return std::unexpected(written.error());

    last_segment_ = segment_num;
    events_.segment_saved(session_.id, segment_num, path.string(), epoch_seconds());
    return path;
}
