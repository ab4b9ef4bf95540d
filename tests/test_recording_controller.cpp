#include <catch2/catch_test_macros.hpp>

#include "device_selector.hpp"
#include "events.hpp"
#include "fakes.hpp"
#include "recording_controller.hpp"
#include "vad/energy_vad.hpp"
#include "wav.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct ControllerHarness {
    fakes::TmpDir tmp{"controller"};
    Config config;
    fakes::FakeAudioHost host;
    fakes::FakeBus bus;
    EventPublisher events{bus};
    EnergyVad vad;
    DeviceSelector selector{host};
    std::vector<RecordingSummary> summaries;
    std::optional<RecordingController> controller;

    ControllerHarness() {
        config.storage.temp_dir = (tmp.path / "temp").string();
        config.storage.recordings_dir = (tmp.path / "recordings").string();
        config.capture.stop_timeout_ms = 2000;
        host.add_device(0, "USB Audio Device", 16000.0, 1, {16000});
    }

    RecordingController& make() {
        controller.emplace(config, host, selector, vad, events);
        controller->set_on_stopped([this](const RecordingSummary& s) { summaries.push_back(s); });
        return *controller;
    }

    fs::path recording(const std::string& id) const {
        return fs::path(config.storage.recordings_dir) / (id + ".wav");
    }
};

} // namespace

TEST_CASE("RecordingController", "[controller]") {
    ControllerHarness h;

    SECTION("SecondStartIsRejected") {
        auto& rc = h.make();
        REQUIRE(rc.start_recording("a"));
        REQUIRE_FALSE(rc.start_recording("b"));
        REQUIRE(h.host.open_count == 1);
        REQUIRE(rc.session_id() == "a");
        REQUIRE(h.bus.events("recording_started").size() == 1);

        REQUIRE(rc.stop_recording().has_value());
    }

    SECTION("StopWhileIdle") {
        auto& rc = h.make();
        auto res = rc.stop_recording();
        REQUIRE(res.has_value());
        REQUIRE_FALSE(res->has_value());

        auto stopped = h.bus.events("recording_stopped");
        REQUIRE(stopped.size() == 1);
        REQUIRE(stopped[0]["path"].is_null());
        REQUIRE(stopped[0]["session_id"].is_null());

        REQUIRE(rc.stop_recording("late").has_value());
        stopped = h.bus.events("recording_stopped");
        REQUIRE(stopped.size() == 2);
        REQUIRE(stopped[1]["session_id"] == "late");
        REQUIRE(stopped[1]["path"].is_null());
        REQUIRE(h.summaries.empty());
    }

    SECTION("EndToEnd") {
        h.host.state->push(fakes::speech(1024), 50);
        h.host.state->push(fakes::silence(1024), 10);
        auto& rc = h.make();

        REQUIRE(rc.start_recording("meeting1"));
        REQUIRE(rc.state() == SessionState::Recording);
        REQUIRE(h.host.state->wait_exhausted());

        auto res = rc.stop_recording();
        REQUIRE(res.has_value());
        REQUIRE(*res == std::optional<std::string>("meeting1"));
        REQUIRE(rc.state() == SessionState::Idle);

        auto info = wav::probe(h.recording("meeting1"));
        REQUIRE(info.has_value());
        REQUIRE(info->first.sample_rate == 16000);
        REQUIRE(info->second == 60 * 1024);
        REQUIRE_FALSE(fs::exists(fs::path(h.config.storage.temp_dir) / "meeting1"));

        REQUIRE(h.bus.event_types() == std::vector<std::string>{"recording_started", "recording_stopped"});
        auto stopped = h.bus.events("recording_stopped");
        REQUIRE(stopped[0]["session_id"] == "meeting1");
        REQUIRE(stopped[0]["path"] == h.recording("meeting1").string());

        REQUIRE(h.bus.on(channel::AUDIO_SEGMENTS).size() == 1);
        auto display = h.bus.on(channel::HARDWARE);
        REQUIRE(display.size() == 2);
        REQUIRE(display[0]["state"] == "recording");
        REQUIRE(display[1]["state"] == "processing");

        REQUIRE(h.host.state->stopped.load());
        REQUIRE(h.host.state->closed.load());
        REQUIRE(h.host.state->reads_after_close.load() == 0);

        REQUIRE(h.summaries.size() == 1);
        REQUIRE(h.summaries[0].session_id == "meeting1");
        REQUIRE(h.summaries[0].segments == 1);
        REQUIRE(h.summaries[0].duration_s == 60.0 * 1024 / 16000);
        REQUIRE(h.summaries[0].device_name == "USB Audio Device");
    }

    SECTION("NoAudioStopsWithNullPath") {
        auto& rc = h.make();
        REQUIRE(rc.start_recording("quiet"));
        REQUIRE(h.host.state->wait_exhausted());

        auto res = rc.stop_recording();
        REQUIRE(res.has_value());
        REQUIRE(*res == std::optional<std::string>("quiet"));

        auto stopped = h.bus.events("recording_stopped");
        REQUIRE(stopped.size() == 1);
        REQUIRE(stopped[0]["session_id"] == "quiet");
        REQUIRE(stopped[0]["path"].is_null());
        REQUIRE_FALSE(fs::exists(h.recording("quiet")));
        REQUIRE_FALSE(fs::exists(fs::path(h.config.storage.temp_dir) / "quiet"));
        REQUIRE(h.summaries.size() == 1);
        REQUIRE_FALSE(h.summaries[0].path.has_value());
    }

    SECTION("GeneratedSessionId") {
        auto& rc = h.make();
        REQUIRE(rc.start_recording());
        auto id = rc.session_id();
        REQUIRE(id.has_value());
        REQUIRE(id->size() == 15);
        REQUIRE((*id)[8] == '_');
        REQUIRE(rc.stop_recording().has_value());
    }

    SECTION("OpenFailureLeavesNoTrace") {
        h.host.fail_open = true;
        auto& rc = h.make();

        REQUIRE_FALSE(rc.start_recording("broken"));
        REQUIRE(rc.state() == SessionState::Idle);
        REQUIRE_FALSE(fs::exists(fs::path(h.config.storage.temp_dir) / "broken"));
        REQUIRE(h.bus.events("recording_started").empty());
    }

    SECTION("UnsafeSessionIdIsRejected") {
        auto& rc = h.make();
        std::vector<std::string> unsafe = {"../../etc/x", "a/b", "..", std::string("nul\0id", 6)};
        for (const auto& id : unsafe) {
            REQUIRE_FALSE(rc.start_recording(id));
        }
        REQUIRE(rc.state() == SessionState::Idle);
        REQUIRE(h.host.open_count == 0);
        REQUIRE(h.bus.events("recording_started").empty());
        REQUIRE_FALSE(fs::exists(h.config.storage.temp_dir));

        REQUIRE(rc.start_recording("team-sync.v2"));
        REQUIRE(rc.stop_recording().has_value());
    }

    SECTION("NativeRateDevice") {
        h.host.devices.clear();
        h.host.supported.clear();
        h.host.add_device(3, "USB Audio Device", 44100.0, 1, {44100});
        h.host.state->push(fakes::speech(2822), 10);
        auto& rc = h.make();

        REQUIRE(rc.start_recording("native"));
        REQUIRE(h.host.opened_device == 3);
        REQUIRE(h.host.opened_rate == 44100);
        REQUIRE(h.host.opened_frames == 2822);
        REQUIRE(h.host.state->wait_exhausted());
        REQUIRE(rc.stop_recording().has_value());

        auto info = wav::probe(h.recording("native"));
        REQUIRE(info.has_value());
        REQUIRE(info->first.sample_rate == 16000);
        REQUIRE(info->second == 10239);
        REQUIRE(h.summaries[0].capture_rate == 44100);
        REQUIRE(h.summaries[0].target_rate == 16000);
    }

    SECTION("PauseAndResume") {
        auto& rc = h.make();
        REQUIRE_FALSE(rc.pause_recording());
        REQUIRE_FALSE(rc.resume_recording());

        REQUIRE(rc.start_recording("p"));
        REQUIRE_FALSE(rc.resume_recording());
        REQUIRE(rc.pause_recording());
        REQUIRE(rc.state() == SessionState::Paused);
        REQUIRE_FALSE(rc.pause_recording());
        REQUIRE(rc.resume_recording());
        REQUIRE(rc.state() == SessionState::Recording);

        auto paused = h.bus.events("recording_paused");
        REQUIRE(paused.size() == 1);
        REQUIRE(paused[0]["session_id"] == "p");
        REQUIRE(h.bus.events("recording_resumed").size() == 1);

        REQUIRE(rc.stop_recording().has_value());
        REQUIRE_FALSE(rc.pause_recording());
    }

    SECTION("StopTimeoutKeepsStreamOpen") {
        h.config.capture.stop_timeout_ms = 50;
        h.host.state->hold = true;
        auto& rc = h.make();

        REQUIRE(rc.start_recording("stuck"));
        REQUIRE(h.host.state->wait_held());

        auto res = rc.stop_recording();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("unsafe shutdown") != std::string::npos);
        REQUIRE(rc.is_recording());
        REQUIRE_FALSE(h.host.state->closed.load());
        REQUIRE(h.bus.events("recording_stopped").empty());
        REQUIRE_FALSE(rc.start_recording("other"));
        REQUIRE_FALSE(rc.pause_recording());

        h.host.state->hold = false;
        auto retry = rc.stop_recording();
        REQUIRE(retry.has_value());
        REQUIRE(*retry == std::optional<std::string>("stuck"));
        REQUIRE(h.host.state->closed.load());
        REQUIRE(h.host.state->reads_after_close.load() == 0);
        REQUIRE_FALSE(rc.is_recording());
    }

    SECTION("DestructorStopsActiveSession") {
        h.host.state->push(fakes::speech(1024), 5);
        auto& rc = h.make();
        REQUIRE(rc.start_recording("scoped"));
        REQUIRE(h.host.state->wait_exhausted());

        h.controller.reset();
        REQUIRE(h.host.state->closed.load());
        REQUIRE(fs::exists(h.recording("scoped")));
    }
}
