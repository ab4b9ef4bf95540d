#pragma once

#include "config.hpp"
#include "device_selector.hpp"
#include "events.hpp"
#include "platform/audio_host.hpp"
#include "platform/message_bus.hpp"
#include "recording_controller.hpp"
#include "session.hpp"
#include "storage/history_db.hpp"
#include "vad/vad_engine.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Platform-independent service logic: turns bus commands into recording
// lifecycle calls and records finished sessions.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose, AudioHost& audio, MessageBus& bus, VadEngine& vad);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // Handles one payload from the command channel. Unknown or malformed
    // commands are ignored.
    void handle_command(const nlohmann::json& cmd);

    SessionState session_state() const { return controller_.state(); }
    RecordingController& controller() { return controller_; }

    void shutdown();

private:
    void handle_start(const nlohmann::json& cmd);
    void handle_stop(const nlohmann::json& cmd);
    void handle_pause(const nlohmann::json& cmd);
    void handle_resume(const nlohmann::json& cmd);

    void on_recording_stopped(const RecordingSummary& summary);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    AudioHost& audio_;
    MessageBus& bus_;
    VadEngine& vad_;

    EventPublisher events_;
    DeviceSelector selector_;
    // Outlives controller_, whose destructor may still report a session.
    HistoryDb history_db_;
    RecordingController controller_;
};
