#pragma once

#include "platform/audio_host.hpp"

#include <atomic>
#include <cstdint>
#include <portaudio.h>

class PortAudioStream : public InputStream {
public:
    PortAudioStream(PaStream* stream, uint16_t channels);
    ~PortAudioStream() override;

    PortAudioStream(const PortAudioStream&) = delete;
    PortAudioStream& operator=(const PortAudioStream&) = delete;

    std::expected<size_t, std::string> read(std::span<int16_t> out) override;
    void stop() override;
    void close() override;

    uint64_t overflow_count() const { return overflows_.load(std::memory_order_relaxed); }

private:
    PaStream* stream_;
    uint16_t channels_;
    std::atomic<uint64_t> overflows_{0};
};

class PortAudioHost : public AudioHost {
public:
    PortAudioHost();
    ~PortAudioHost() override;

    PortAudioHost(const PortAudioHost&) = delete;
    PortAudioHost& operator=(const PortAudioHost&) = delete;

    bool init();

    std::vector<DeviceDescriptor> input_devices() override;
    bool supports(int device, uint32_t sample_rate, uint16_t channels) override;
    std::expected<std::unique_ptr<InputStream>, std::string>
        open(std::optional<int> device, uint32_t sample_rate, uint16_t channels,
             size_t frames_per_buffer) override;

private:
    bool initialized_ = false;
};
