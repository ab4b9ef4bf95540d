#include "capture_loop.hpp"

#include <exception>
#include <format>
#include <print>

CaptureLoop::CaptureLoop(const SessionInfo& session, const SessionFlags& flags,
                         InputStream& stream, VoiceActivityClassifier& vad,
                         SegmentWriter& writer, SegmentationPolicy policy, bool verbose)
    : session_(session), flags_(flags), stream_(stream), vad_(vad), writer_(writer),
      policy_(policy), verbose_(verbose) {}

void CaptureLoop::run() {
    AudioBuffer scratch(session_.frames_per_buffer * session_.channels);

    try {
        while (flags_.active() && !error_) {
            iterate(scratch);
        }
    } catch (const std::exception& e) {
        error_ = e.what();
        std::println(stderr, "capture: session {}: error in capture loop after {} buffers: {}",
                     session_.id, buffers_read_, e.what());
    }

    if (!run_.empty()) {
        size_t pending = run_.size();
        if (flush()) {
            log(std::format("Saved final segment {} ({} buffers)", next_segment_ - 1, pending));
        }
    }

    log(std::format("Capture loop for {} exited: {} buffers, {} segments",
                    session_.id, buffers_read_, next_segment_));
}

void CaptureLoop::iterate(AudioBuffer& scratch) {
    auto frames = stream_.read(scratch);
    if (!frames) {
        error_ = frames.error();
        std::println(stderr, "capture: session {}: read failed: {}", session_.id, frames.error());
        return;
    }
    if (*frames == 0) return;
    ++buffers_read_;

    // Keep draining the device while paused; the audio is discarded.
    if (flags_.paused()) {
        if (!was_paused_ && !run_.empty()) flush();
        was_paused_ = true;
        return;
    }
    was_paused_ = false;

    AudioBuffer chunk(scratch.begin(),
                      scratch.begin() + static_cast<std::ptrdiff_t>(*frames * session_.channels));
    bool speech = vad_.is_speech(chunk, session_.capture_rate);
    run_.push(std::move(chunk), speech);

    if (policy_.should_flush(run_.size(), run_.silence_streak())) {
        size_t n = run_.size();
        if (flush()) {
            log(std::format("Saved segment {} ({} buffers)", next_segment_ - 1, n));
        }
    }
}

bool CaptureLoop::flush() {
    auto saved = writer_.save(run_.buffers(), next_segment_);
    if (!saved) {
        // The run is kept so the exit path can retry once.
        error_ = saved.error();
        std::println(stderr, "capture: session {}: failed to save segment {}: {}",
                     session_.id, next_segment_, saved.error());
        return false;
    }
    run_.take();
    ++next_segment_;
    return true;
}

void CaptureLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetcap] {}", msg);
    }
}
