#pragma once

#include "events.hpp"
#include "segmentation.hpp"
#include "session.hpp"

#include <expected>
#include <filesystem>
#include <span>
#include <string>

// Persists flushed runs as <temp_dir>/<session_id>/segment_NNNN.wav at the
// session's target rate and announces each one on the segments channel.
class SegmentWriter {
public:
    SegmentWriter(SessionInfo session, std::filesystem::path temp_dir, EventPublisher& events);

    // Segment numbers must strictly increase; an existing file is never replaced.
    std::expected<std::filesystem::path, std::string>
        save(std::span<const AudioBuffer> buffers, int segment_num);

    std::filesystem::path session_dir() const { return temp_dir_ / session_.id; }
    std::filesystem::path segment_path(int segment_num) const;

    static std::filesystem::path segment_path(const std::filesystem::path& session_dir, int segment_num);

private:
    SessionInfo session_;
    std::filesystem::path temp_dir_;
    EventPublisher& events_;
    int last_segment_ = -1;
};
