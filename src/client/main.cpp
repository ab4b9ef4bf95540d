#include "bus/redis_bus.hpp"
#include "config.hpp"
#include "device_selector.hpp"
#include "events.hpp"
#include "platform/linux/portaudio_host.hpp"
#include "platform/platform_paths.hpp"
#include "storage/history_db.hpp"

#include <chrono>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [-c CONFIG] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  devices                         List input devices and the one that would be used");
    std::println(stderr, "  start [--session ID]            Start recording");
    std::println(stderr, "  stop [--session ID] [--wait]    Stop recording (--wait prints the combined file)");
    std::println(stderr, "  pause                           Pause recording");
    std::println(stderr, "  resume                          Resume recording");
    std::println(stderr, "  history [--limit N]             Show recorded sessions");
}

static int list_devices(const Config& config) {
    PortAudioHost host;
    if (!host.init()) return 1;

    DeviceSelector selector(host, KeywordClassifier(config.capture.external_keywords,
                                                    config.capture.builtin_keywords));
    auto devices = host.input_devices();
    if (devices.empty()) {
        std::println("No input devices found");
    }
    for (const auto& d : devices) {
        std::println("[{}] {} ({}, {:.0f}Hz, {} ch)", d.index, d.name,
                     to_string(selector.classify(d.name)), d.default_sample_rate,
                     d.max_input_channels);
    }

    auto choice = selector.select(config.audio.sample_rate, config.audio.channels,
                                  config.audio.chunk_size);
    if (choice.device) {
        std::println("Selected: [{}] {} at {}Hz, {} frames/read", choice.device->index,
                     choice.device->name, choice.sample_rate, choice.frames_per_buffer);
    } else {
        std::println("Selected: system default at {}Hz", choice.sample_rate);
    }
    return 0;
}

static int show_history(const Config& config, int limit) {
    std::string db_path = config.storage.history_db;
    if (db_path.empty()) db_path = platform::data_dir() + "/history.db";

    HistoryDb db;
    if (!db.open_readonly(db_path)) {
        std::println(stderr, "No history at {}", db_path);
        return 1;
    }

    for (const auto& e : db.recent(limit)) {
        std::println("[{}] {}  {:.1f}s, {} segments", e.started_at, e.session_id,
                     e.duration, e.segments);
        if (!e.audio_path.empty()) std::println("  File: {}", e.audio_path);
        if (!e.device.empty()) {
            std::println("  Device: {} ({}Hz -> {}Hz)", e.device, e.capture_rate, e.target_rate);
        }
    }
    return 0;
}

// Blocks until the daemon reports recording_stopped, or the deadline passes.
static int wait_for_stop(RedisBus& bus, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::vector<BusMessage> messages;

    while (std::chrono::steady_clock::now() < deadline) {
        messages.clear();
        if (!bus.wait_messages(messages, 200)) {
            std::println(stderr, "Lost connection to the message bus");
            return 1;
        }
        for (const auto& msg : messages) {
            if (msg.payload.value("type", "") != "recording_stopped") continue;
            auto path = msg.payload.find("path");
            if (path != msg.payload.end() && path->is_string()) {
                std::println("{}", path->get<std::string>());
            } else {
                std::println("No audio captured");
            }
            return 0;
        }
    }
    std::println(stderr, "No response from daemon (timeout)");
    return 1;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string command;
    std::optional<std::string> session_id;
    bool wait = false;
    int limit = 10;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--session" && i + 1 < argc) {
            session_id = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--wait") {
            wait = true;
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    if (command == "devices") return list_devices(config);
    if (command == "history") return show_history(config, limit > 0 ? limit : 10);

    json cmd;
    if (command == "start") {
        cmd = {{"action", "start_recording"}};
    } else if (command == "stop") {
        cmd = {{"action", "stop_recording"}};
    } else if (command == "pause") {
        cmd = {{"action", "pause_recording"}};
    } else if (command == "resume") {
        cmd = {{"action", "resume_recording"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }
    if (session_id && (command == "start" || command == "stop")) cmd["session_id"] = *session_id;

    RedisBus bus(config.bus.host, config.bus.port);
    if (!bus.connect()) {
        std::println(stderr, "Failed to connect to message bus at {}:{}",
                     config.bus.host, config.bus.port);
        return 1;
    }

    bool waiting = wait && command == "stop";
    // Subscribe before publishing so the reply cannot be missed
    if (waiting && !bus.subscribe({channel::EVENTS})) {
        std::println(stderr, "Failed to subscribe to '{}'", channel::EVENTS);
        return 1;
    }

    if (!bus.publish(channel::COMMANDS, cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    if (waiting) {
        // The combine step runs after the capture thread exits
        return wait_for_stop(bus, static_cast<int>(config.capture.stop_timeout_ms) + 30000);
    }

    std::println("OK");
    return 0;
}
