#pragma once

#include "platform/message_bus.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace channel {
inline constexpr const char* COMMANDS = "commands";
inline constexpr const char* EVENTS = "events";
inline constexpr const char* AUDIO_SEGMENTS = "audio_segments";
inline constexpr const char* HARDWARE = "hardware_commands";
} // namespace channel

// Local time as ISO-8601 with microseconds, e.g. 2024-05-01T09:30:00.123456.
std::string iso_timestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());
double epoch_seconds(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());
// Local time as YYYYMMDD_HHMMSS.
std::string default_session_id(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

// Fire-and-forget publishing of lifecycle events. Safe to call from the
// capture thread as long as the bus' publish() is.
class EventPublisher {
public:
    explicit EventPublisher(MessageBus& bus);

    void recording_started(const std::string& session_id);
    void recording_stopped(const std::optional<std::string>& session_id,
                           const std::optional<std::string>& path);
    void recording_paused(const std::string& session_id);
    void recording_resumed(const std::string& session_id);
    void segment_saved(const std::string& session_id, int segment_num,
                       const std::string& path, double timestamp);
    // state: "recording" or "processing"
    void display_state(const std::string& state, const std::optional<std::string>& session_id);

private:
    void send(const char* ch, const nlohmann::json& msg);

    MessageBus& bus_;
};
