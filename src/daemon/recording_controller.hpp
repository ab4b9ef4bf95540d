#pragma once

#include "capture_loop.hpp"
#include "config.hpp"
#include "device_selector.hpp"
#include "events.hpp"
#include "platform/audio_host.hpp"
#include "segment_combiner.hpp"
#include "segment_writer.hpp"
#include "session.hpp"
#include "vad/vad_engine.hpp"
#include "vad/voice_classifier.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Owns the recording lifecycle: at most one session, one capture thread,
// and the input stream, which is closed only after that thread has exited.
// All methods are called from a single (control) thread.
class RecordingController {
public:
    using StoppedCallback = std::function<void(const RecordingSummary&)>;

    RecordingController(const Config& config, AudioHost& host, DeviceSelector& selector,
                        VadEngine& vad, EventPublisher& events, bool verbose = false);
    ~RecordingController();

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    // False, with no side effects, if a session is already active, the id
    // contains '/', ".." or NUL, or the stream cannot be opened.
    bool start_recording(std::optional<std::string> session_id = std::nullopt);

    // Returns the stopped session id, or an empty optional when idle (a
    // recording_stopped event with a null path is still published).
    // Errors only when the capture thread does not exit within the stop
    // timeout; the stream is then left open and the session stays owned here
    // so a later call can finish the shutdown.
    std::expected<std::optional<std::string>, std::string>
        stop_recording(std::optional<std::string> session_id_hint = std::nullopt);

    bool pause_recording();
    bool resume_recording();

    SessionState state() const;
    bool is_recording() const { return active_ != nullptr; }
    std::optional<std::string> session_id() const;
    double recording_duration() const;

    void set_on_stopped(StoppedCallback cb) { on_stopped_ = std::move(cb); }

private:
    struct ActiveSession;

    void log(const std::string& msg);

    Config config_;
    AudioHost& host_;
    DeviceSelector& selector_;
    VadEngine& vad_;
    EventPublisher& events_;
    bool verbose_;

    SegmentCombiner combiner_;
    StoppedCallback on_stopped_;

    std::unique_ptr<ActiveSession> active_;
};
