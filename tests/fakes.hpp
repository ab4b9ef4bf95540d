#pragma once

#include "platform/audio_host.hpp"
#include "platform/message_bus.hpp"
#include "segmentation.hpp"
#include "session.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fakes {

// Unique scratch directory, removed with its contents on destruction.
struct TmpDir {
    std::filesystem::path path;

    explicit TmpDir(const std::string& tag = "dir") {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() /
               ("meetcap_test_" + tag + "_" + std::to_string(getpid()) + "_" +
                std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

inline AudioBuffer speech(size_t samples, int16_t amplitude = 3000) {
    AudioBuffer b(samples);
    // Square wave: constant RMS well above every energy threshold.
    for (size_t i = 0; i < samples; ++i) b[i] = (i / 8) % 2 ? amplitude : static_cast<int16_t>(-amplitude);
    return b;
}

inline AudioBuffer silence(size_t samples) {
    return AudioBuffer(samples, 0);
}

// Shared between a FakeAudioHost, the streams it opens, and the test body.
struct FakeStreamState {
    std::mutex mutex;
    std::deque<AudioBuffer> script;
    // Called with the 0-based index of each scripted buffer before it is returned.
    std::function<void(size_t)> on_read;
    // Index of a read that fails instead of returning data.
    std::optional<size_t> fail_at;
    // When set, streams are deactivated once the script runs dry.
    SessionFlags* deactivate_when_exhausted = nullptr;

    std::atomic<bool> hold{false};      // reads block while set
    std::atomic<bool> held{false};      // a read is blocked on `hold`
    std::atomic<bool> exhausted{false};
    std::atomic<bool> stopped{false};
    std::atomic<bool> closed{false};
    std::atomic<int> reads_after_close{0};
    std::atomic<size_t> served{0};

    // Queues more input; wait_exhausted() then waits for it to be consumed.
    void push(AudioBuffer b, size_t count = 1) {
        std::lock_guard lock(mutex);
        for (size_t i = 0; i < count; ++i) script.push_back(b);
        exhausted.store(false);
    }

    // Polls until the scripted input is consumed.
    bool wait_exhausted(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!exhausted.load()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    bool wait_held(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!held.load()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }
};

class FakeStream : public InputStream {
public:
    FakeStream(std::shared_ptr<FakeStreamState> state, uint16_t channels)
        : state_(std::move(state)), channels_(channels) {}

    std::expected<size_t, std::string> read(std::span<int16_t> out) override {
        if (state_->closed.load()) {
            state_->reads_after_close.fetch_add(1);
            return std::unexpected("read on closed stream");
        }

        while (state_->hold.load()) {
            state_->held.store(true);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        AudioBuffer next;
        size_t index = 0;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->script.empty()) {
                state_->exhausted.store(true);
                if (state_->deactivate_when_exhausted) state_->deactivate_when_exhausted->set_active(false);
            } else {
                next = std::move(state_->script.front());
                state_->script.pop_front();
                index = state_->served.fetch_add(1);
            }
        }

        if (next.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return 0;
        }
        if (state_->fail_at && *state_->fail_at == index) {
            return std::unexpected("device unplugged");
        }
        if (state_->on_read) state_->on_read(index);

        size_t n = std::min(next.size(), out.size());
        std::copy_n(next.begin(), n, out.begin());
        return n / channels_;
    }

    void stop() override { state_->stopped.store(true); }
    void close() override { state_->closed.store(true); }

private:
    std::shared_ptr<FakeStreamState> state_;
    uint16_t channels_;
};

class FakeAudioHost : public AudioHost {
public:
    std::vector<DeviceDescriptor> devices;
    std::set<std::pair<int, uint32_t>> supported; // (device index, rate)
    bool fail_open = false;

    int open_count = 0;
    std::optional<int> opened_device;
    uint32_t opened_rate = 0;
    size_t opened_frames = 0;

    std::shared_ptr<FakeStreamState> state = std::make_shared<FakeStreamState>();

    void add_device(int index, std::string name, double native_rate, int channels = 1,
                    std::vector<uint32_t> rates = {}) {
        devices.push_back({.index = index, .name = std::move(name),
                           .default_sample_rate = native_rate, .max_input_channels = channels});
        for (auto r : rates) supported.emplace(index, r);
    }

    std::vector<DeviceDescriptor> input_devices() override { return devices; }

    bool supports(int device, uint32_t sample_rate, uint16_t /*channels*/) override {
        return supported.contains({device, sample_rate});
    }

    std::expected<std::unique_ptr<InputStream>, std::string>
    open(std::optional<int> device, uint32_t sample_rate, uint16_t channels,
         size_t frames_per_buffer) override {
        ++open_count;
        if (fail_open) return std::unexpected("device busy");
        opened_device = device;
        opened_rate = sample_rate;
        opened_frames = frames_per_buffer;
        return std::make_unique<FakeStream>(state, channels);
    }
};

// Records everything published; never delivers anything.
class FakeBus : public MessageBus {
public:
    bool publish(const std::string& channel, const nlohmann::json& message) override {
        std::lock_guard lock(mutex_);
        published_.push_back({channel, message});
        return true;
    }

    bool subscribe(const std::vector<std::string>& /*channels*/) override { return true; }
    int event_fd() const override { return -1; }
    bool read_messages(std::vector<BusMessage>& /*out*/) override { return true; }

    std::vector<BusMessage> published() const {
        std::lock_guard lock(mutex_);
        return published_;
    }

    std::vector<nlohmann::json> on(const std::string& channel) const {
        std::vector<nlohmann::json> out;
        for (auto& m : published()) {
            if (m.channel == channel) out.push_back(m.payload);
        }
        return out;
    }

    // Event payloads on the events channel with the given type.
    std::vector<nlohmann::json> events(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (auto& p : on("events")) {
            if (p.value("type", "") == type) out.push_back(p);
        }
        return out;
    }

    // Event types on the events channel, in publish order.
    std::vector<std::string> event_types() const {
        std::vector<std::string> out;
        for (auto& p : on("events")) out.push_back(p.value("type", ""));
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<BusMessage> published_;
};

} // namespace fakes
