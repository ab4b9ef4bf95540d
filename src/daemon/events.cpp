#include "events.hpp"

#include <ctime>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

std::tm local_tm(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

json nullable(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    auto tm = local_tm(tp);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  tp.time_since_epoch()).count() % 1000000;
    if (us < 0) us += 1000000;
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, us);
}

double epoch_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::string default_session_id(std::chrono::system_clock::time_point tp) {
    auto tm = local_tm(tp);
    return std::format("{:04}{:02}{:02}_{:02}{:02}{:02}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec);
}

EventPublisher::EventPublisher(MessageBus& bus) : bus_(bus) {}

void EventPublisher::recording_started(const std::string& session_id) {
    send(channel::EVENTS, {
        {"type", "recording_started"},
        {"session_id", session_id},
        {"timestamp", iso_timestamp()},
    });
}

void EventPublisher::recording_stopped(const std::optional<std::string>& session_id,
                                       const std::optional<std::string>& path) {
    send(channel::EVENTS, {
        {"type", "recording_stopped"},
        {"session_id", nullable(session_id)},
        {"path", nullable(path)},
        {"timestamp", iso_timestamp()},
    });
}

void EventPublisher::recording_paused(const std::string& session_id) {
    send(channel::EVENTS, {
        {"type", "recording_paused"},
        {"session_id", session_id},
        {"timestamp", iso_timestamp()},
    });
}

void EventPublisher::recording_resumed(const std::string& session_id) {
    send(channel::EVENTS, {
        {"type", "recording_resumed"},
        {"session_id", session_id},
        {"timestamp", iso_timestamp()},
    });
}

void EventPublisher::segment_saved(const std::string& session_id, int segment_num,
                                   const std::string& path, double timestamp) {
    send(channel::AUDIO_SEGMENTS, {
        {"session_id", session_id},
        {"segment_num", segment_num},
        {"path", path},
        {"timestamp", timestamp},
    });
}

void EventPublisher::display_state(const std::string& state,
                                   const std::optional<std::string>& session_id) {
    send(channel::HARDWARE, {
        {"action", "update_display"},
        {"state", state},
        {"session_id", nullable(session_id)},
    });
}

void EventPublisher::send(const char* ch, const json& msg) {
    if (!bus_.publish(ch, msg)) {
        std::println(stderr, "bus: publish to {} failed, dropping {}", ch, msg.value("type", "message"));
    }
}
