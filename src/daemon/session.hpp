#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

enum class SessionState { Idle, Recording, Paused };

// Immutable description of one recording attempt.
struct SessionInfo {
    std::string id;
    uint32_t capture_rate = 16000;
    uint32_t target_rate = 16000;
    uint16_t channels = 1;
    size_t frames_per_buffer = 1024;
    std::string device_name; // empty: system default
    std::chrono::system_clock::time_point started_at;

    bool needs_resampling() const { return capture_rate != target_rate; }
};

// Outcome of one stopped session.
struct RecordingSummary {
    std::string session_id;
    std::string started_at;
    std::string stopped_at;
    std::optional<std::string> path;
    double duration_s = 0.0;
    size_t segments = 0;
    std::string device_name;
    uint32_t capture_rate = 0;
    uint32_t target_rate = 0;
};

// State shared with the capture thread. Only the controller writes it;
// the capture loop polls it once per buffer.
class SessionFlags {
public:
    bool active() const { return active_.load(std::memory_order_acquire); }
    bool paused() const { return paused_.load(std::memory_order_acquire); }

    void set_active(bool v) { active_.store(v, std::memory_order_release); }
    void set_paused(bool v) { paused_.store(v, std::memory_order_release); }

private:
    std::atomic<bool> active_{false};
    std::atomic<bool> paused_{false};
};

inline const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Paused: return "paused";
    }
    return "idle";
}
