#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <format>
#include <optional>
#include <print>

namespace {

std::optional<std::string> optional_string(const nlohmann::json& cmd, const char* key) {
    auto it = cmd.find(key);
    if (it == cmd.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, AudioHost& audio, MessageBus& bus,
                       VadEngine& vad)
    : config_(std::move(config)), verbose_(verbose),
      audio_(audio), bus_(bus), vad_(vad),
      events_(bus_),
      selector_(audio_,
                KeywordClassifier(config_.capture.external_keywords, config_.capture.builtin_keywords),
                verbose_),
      controller_(config_, audio_, selector_, vad_, events_, verbose_) {
    controller_.set_on_stopped([this](const RecordingSummary& s) { on_recording_stopped(s); });
}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    std::string db_path = config_.storage.history_db;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = !data.empty() ? data + "/history.db" : "/tmp/meetcap/history.db";
    }
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    log(std::format("Capture target {}Hz, {}ch, {} frames/read, VAD aggressiveness {}",
                    config_.audio.sample_rate, config_.audio.channels,
                    config_.audio.chunk_size, config_.vad.aggressiveness));
    return true;
}

void DaemonCore::handle_command(const nlohmann::json& cmd) {
    if (!cmd.is_object()) {
        log("Ignoring non-object command: " + cmd.dump());
        return;
    }

    auto action = optional_string(cmd, "action").value_or("");
    if (action == "start_recording") return handle_start(cmd);
    if (action == "stop_recording") return handle_stop(cmd);
    if (action == "pause_recording") return handle_pause(cmd);
    if (action == "resume_recording") return handle_resume(cmd);

    log("Ignoring unknown command: " + cmd.dump());
}

void DaemonCore::handle_start(const nlohmann::json& cmd) {
    if (!controller_.start_recording(optional_string(cmd, "session_id"))) {
        log("start_recording rejected");
    }
}

void DaemonCore::handle_stop(const nlohmann::json& cmd) {
    auto res = controller_.stop_recording(optional_string(cmd, "session_id"));
    if (!res) {
        std::println(stderr, "session: stop failed: {}", res.error());
        return;
    }
    if (*res) log("Recording stopped - session " + **res);
}

void DaemonCore::handle_pause(const nlohmann::json& /*cmd*/) {
    if (!controller_.pause_recording()) {
        log("pause_recording ignored (state: " + std::string(to_string(controller_.state())) + ")");
    }
}

void DaemonCore::handle_resume(const nlohmann::json& /*cmd*/) {
    if (!controller_.resume_recording()) {
        log("resume_recording ignored (state: " + std::string(to_string(controller_.state())) + ")");
    }
}

void DaemonCore::on_recording_stopped(const RecordingSummary& summary) {
    if (history_db_.is_open() && !history_db_.insert(summary)) {
        std::println(stderr, "db: failed to record session {}", summary.session_id);
    }
}

void DaemonCore::shutdown() {
    if (controller_.is_recording()) {
        log("Stopping active recording before exit...");
        auto res = controller_.stop_recording();
        if (!res) {
            std::println(stderr, "session: {}", res.error());
        }
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetcap] {}", msg);
    }
}
