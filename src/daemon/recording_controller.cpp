#include "recording_controller.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

// Session ids name a directory under temp_dir and a file under recordings_dir.
bool valid_session_id(const std::string& id) {
    return id.find('/') == std::string::npos && id.find('\0') == std::string::npos &&
           id.find("..") == std::string::npos;
}

} // namespace

struct RecordingController::ActiveSession {
    SessionInfo info;
    SessionFlags flags;
    std::chrono::steady_clock::time_point record_start;
    std::unique_ptr<InputStream> stream;
    std::unique_ptr<SegmentWriter> writer;
    std::unique_ptr<VoiceActivityClassifier> vad;
    std::unique_ptr<CaptureLoop> loop;
    std::future<void> exited;
    // Declared last: joined before anything it references is destroyed.
    std::jthread worker;
};

RecordingController::RecordingController(const Config& config, AudioHost& host,
                                         DeviceSelector& selector, VadEngine& vad,
                                         EventPublisher& events, bool verbose)
    : config_(config), host_(host), selector_(selector), vad_(vad), events_(events),
      verbose_(verbose),
      combiner_(config_.storage.temp_dir, config_.storage.recordings_dir) {}

RecordingController::~RecordingController() {
    if (active_) {
        auto res = stop_recording();
        if (!res) {
            std::println(stderr, "session: {}", res.error());
        }
    }
}

bool RecordingController::start_recording(std::optional<std::string> session_id) {
    if (active_) {
        std::println(stderr, "session: cannot start, already recording {}", active_->info.id);
        return false;
    }

    auto now = std::chrono::system_clock::now();
    std::string id = session_id && !session_id->empty() ? *session_id : default_session_id(now);
    if (!valid_session_id(id)) {
        std::println(stderr, "session: rejecting unsafe session id '{}'", id);
        return false;
    }

    auto session_dir = fs::path(config_.storage.temp_dir) / id;
    std::error_code ec;
    bool created_dir = fs::create_directories(session_dir, ec);
    if (ec) {
        std::println(stderr, "session: cannot create {}: {}", session_dir.string(), ec.message());
        return false;
    }

    auto choice = selector_.select(config_.audio.sample_rate, config_.audio.channels,
                                   config_.audio.chunk_size);
    std::optional<int> device_index;
    if (choice.device) device_index = choice.device->index;

    auto stream = host_.open(device_index, choice.sample_rate, config_.audio.channels,
                             choice.frames_per_buffer);
    if (!stream) {
        std::println(stderr, "session: failed to open input stream: {}", stream.error());
        if (created_dir) fs::remove(session_dir, ec);
        return false;
    }

    auto s = std::make_unique<ActiveSession>();
    s->info = SessionInfo{
        .id = id,
        .capture_rate = choice.sample_rate,
        .target_rate = config_.audio.sample_rate,
        .channels = config_.audio.channels,
        .frames_per_buffer = choice.frames_per_buffer,
        .device_name = choice.device ? choice.device->name : std::string{},
        .started_at = now,
    };
    s->record_start = std::chrono::steady_clock::now();
    s->stream = std::move(*stream);
    s->writer = std::make_unique<SegmentWriter>(s->info, config_.storage.temp_dir, events_);
    s->vad = std::make_unique<VoiceActivityClassifier>(vad_, config_.vad.frame_ms, s->info.channels);
    s->loop = std::make_unique<CaptureLoop>(
        s->info, s->flags, *s->stream, *s->vad, *s->writer,
        SegmentationPolicy{
            .min_chunks = config_.segmentation.min_chunks,
            .max_chunks = config_.segmentation.max_chunks,
            .silence_chunks = config_.segmentation.silence_chunks,
        },
        verbose_);
    s->flags.set_active(true);

    std::promise<void> exited;
    s->exited = exited.get_future();
    s->worker = std::jthread([loop = s->loop.get(), exited = std::move(exited)]() mutable {
        loop->run();
        exited.set_value();
    });

    active_ = std::move(s);

    events_.recording_started(id);
    events_.display_state("recording", id);

    log(std::format("Recording started - session {} ({}, {}Hz{})", id,
                    active_->info.device_name.empty() ? "default device" : active_->info.device_name,
                    active_->info.capture_rate,
                    active_->info.needs_resampling()
                        ? std::format(" -> {}Hz", active_->info.target_rate) : ""));
    return true;
}

std::expected<std::optional<std::string>, std::string>
RecordingController::stop_recording(std::optional<std::string> session_id_hint) {
    if (!active_) {
        log("Stop requested while idle");
        // Downstream consumers reset to idle on this event.
        events_.recording_stopped(session_id_hint, std::nullopt);
        return std::optional<std::string>{};
    }

    auto& s = *active_;
    if (session_id_hint && *session_id_hint != s.info.id) {
        log(std::format("Stop for {} applies to active session {}", *session_id_hint, s.info.id));
    }

    s.flags.set_active(false);

    // The stream must not be closed while the capture thread may still be
    // inside read().
    auto timeout = std::chrono::milliseconds(config_.capture.stop_timeout_ms);
    if (s.exited.wait_for(timeout) != std::future_status::ready) {
        std::println(stderr, "session: FATAL: capture thread for {} still running after {}ms; "
                             "input stream left open (unsafe shutdown)",
                     s.info.id, timeout.count());
        return std::unexpected(std::format("unsafe shutdown: capture thread for {} did not exit", s.info.id));
    }
    s.worker.join();

    s.stream->stop();
    s.stream->close();

    RecordingSummary summary{
        .session_id = s.info.id,
        .started_at = iso_timestamp(s.info.started_at),
        .stopped_at = iso_timestamp(),
        .path = std::nullopt,
        .duration_s = 0.0,
        .segments = 0,
        .device_name = s.info.device_name,
        .capture_rate = s.info.capture_rate,
        .target_rate = s.info.target_rate,
    };

    auto combined = combiner_.combine(s.info.id);
    if (!combined) {
        std::println(stderr, "session: failed to combine segments for {}: {}", s.info.id, combined.error());
    } else if (*combined) {
        auto& rec = **combined;
        summary.path = rec.path.string();
        summary.duration_s = rec.duration_s();
        summary.segments = rec.segments;
        log(std::format("Combined {} segments -> {} ({:.1f}s)", rec.segments, rec.path.string(),
                        rec.duration_s()));
    } else {
        log("No segments to combine");
        auto session_dir = fs::path(config_.storage.temp_dir) / s.info.id;
        std::error_code ec;
        if (fs::is_directory(session_dir, ec) && fs::is_empty(session_dir, ec) && !ec) {
            fs::remove(session_dir, ec);
        }
    }

    events_.recording_stopped(s.info.id, summary.path);
    events_.display_state("processing", s.info.id);

    auto id = s.info.id;
    active_.reset();

    if (on_stopped_) on_stopped_(summary);
    return id;
}

bool RecordingController::pause_recording() {
    if (!active_ || active_->flags.paused() || !active_->flags.active()) return false;
    active_->flags.set_paused(true);
    events_.recording_paused(active_->info.id);
    log("Recording paused - session " + active_->info.id);
    return true;
}

bool RecordingController::resume_recording() {
    if (!active_ || !active_->flags.paused() || !active_->flags.active()) return false;
    active_->flags.set_paused(false);
    events_.recording_resumed(active_->info.id);
    log("Recording resumed - session " + active_->info.id);
    return true;
}

SessionState RecordingController::state() const {
    if (!active_) return SessionState::Idle;
    return active_->flags.paused() ? SessionState::Paused : SessionState::Recording;
}

std::optional<std::string> RecordingController::session_id() const {
    if (!active_) return std::nullopt;
    return active_->info.id;
}

double RecordingController::recording_duration() const {
    if (!active_) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - active_->record_start).count();
}

void RecordingController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetcap] {}", msg);
    }
}
