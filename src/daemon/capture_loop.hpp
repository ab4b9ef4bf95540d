#pragma once

#include "platform/audio_host.hpp"
#include "segment_writer.hpp"
#include "segmentation.hpp"
#include "session.hpp"
#include "vad/voice_classifier.hpp"

#include <cstddef>
#include <optional>
#include <string>

// Body of the per-session capture thread: read, classify, accumulate, flush.
class CaptureLoop {
public:
    CaptureLoop(const SessionInfo& session, const SessionFlags& flags, InputStream& stream,
                VoiceActivityClassifier& vad, SegmentWriter& writer,
                SegmentationPolicy policy, bool verbose = false);

    // Returns once the session is deactivated or a fatal error occurs.
    // Whatever is still accumulated is written before returning.
    void run();

    int segments_written() const { return next_segment_; }
    size_t buffers_read() const { return buffers_read_; }
    const std::optional<std::string>& error() const { return error_; }

private:
    void iterate(AudioBuffer& scratch);
    bool flush();
    void log(const std::string& msg);

    const SessionInfo& session_;
    const SessionFlags& flags_;
    InputStream& stream_;
    VoiceActivityClassifier& vad_;
    SegmentWriter& writer_;
    SegmentationPolicy policy_;
    bool verbose_;

    AccumulatedRun run_;
    int next_segment_ = 0;
    size_t buffers_read_ = 0;
    bool was_paused_ = false;
    std::optional<std::string> error_;
};
