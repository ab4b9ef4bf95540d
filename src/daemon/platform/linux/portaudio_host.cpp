#include "platform/linux/portaudio_host.hpp"

#include <format>
#include <print>

PortAudioStream::PortAudioStream(PaStream* stream, uint16_t channels)
    : stream_(stream), channels_(channels) {}

PortAudioStream::~PortAudioStream() {
    close();
}

std::expected<size_t, std::string> PortAudioStream::read(std::span<int16_t> out) {
    if (!stream_) return std::unexpected("stream is closed");

    auto frames = static_cast<unsigned long>(out.size() / channels_);
    PaError err = Pa_ReadStream(stream_, out.data(), frames);
    if (err == paInputOverflowed) {
        // Samples were dropped by the device but the buffer is still valid.
        overflows_.fetch_add(1, std::memory_order_relaxed);
        return frames;
    }
    if (err != paNoError) {
        return std::unexpected(Pa_GetErrorText(err));
    }
    return frames;
}

void PortAudioStream::stop() {
    if (!stream_) return;
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError && err != paStreamIsStopped) {
        std::println(stderr, "audio: stop stream failed: {}", Pa_GetErrorText(err));
    }
}

void PortAudioStream::close() {
    if (!stream_) return;
    PaError err = Pa_CloseStream(stream_);
    if (err != paNoError) {
        std::println(stderr, "audio: close stream failed: {}", Pa_GetErrorText(err));
    }
    stream_ = nullptr;

    if (auto n = overflow_count(); n > 0) {
        std::println(stderr, "audio: {} input overflows during capture", n);
    }
}

PortAudioHost::PortAudioHost() = default;

PortAudioHost::~PortAudioHost() {
    if (initialized_) Pa_Terminate();
}

bool PortAudioHost::init() {
    if (initialized_) return true;
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::println(stderr, "audio: failed to initialize PortAudio: {}", Pa_GetErrorText(err));
        return false;
    }
    initialized_ = true;
    return true;
}

std::vector<DeviceDescriptor> PortAudioHost::input_devices() {
    std::vector<DeviceDescriptor> out;
    if (!initialized_) return out;

    int count = Pa_GetDeviceCount();
    if (count < 0) {
        std::println(stderr, "audio: device enumeration failed: {}", Pa_GetErrorText(count));
        return out;
    }

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;
        out.push_back({
            .index = i,
            .name = info->name ? info->name : "",
            .default_sample_rate = info->defaultSampleRate,
            .max_input_channels = info->maxInputChannels,
        });
    }
    return out;
}

bool PortAudioHost::supports(int device, uint32_t sample_rate, uint16_t channels) {
    if (!initialized_) return false;

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info || info->maxInputChannels < channels) return false;

    PaStreamParameters params{};
    params.device = device;
    params.channelCount = channels;
    params.sampleFormat = paInt16;
    params.suggestedLatency = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    return Pa_IsFormatSupported(&params, nullptr, sample_rate) == paFormatIsSupported;
}

std::expected<std::unique_ptr<InputStream>, std::string>
PortAudioHost::open(std::optional<int> device, uint32_t sample_rate, uint16_t channels,
                    size_t frames_per_buffer) {
    if (!initialized_) return std::unexpected("PortAudio not initialized");

    PaDeviceIndex index = device ? *device : Pa_GetDefaultInputDevice();
    if (index == paNoDevice) return std::unexpected("no default input device available");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info) return std::unexpected(std::format("invalid device index {}", index));

    PaStreamParameters params{};
    params.device = index;
    params.channelCount = channels;
    params.sampleFormat = paInt16;
    params.suggestedLatency = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    // No callback: blocking read mode.
    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream, &params, nullptr, sample_rate,
                                static_cast<unsigned long>(frames_per_buffer),
                                paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        return std::unexpected(std::format("open {} at {}Hz failed: {}", info->name, sample_rate,
                                           Pa_GetErrorText(err)));
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        Pa_CloseStream(stream);
        return std::unexpected(std::format("start stream failed: {}", Pa_GetErrorText(err)));
    }

    return std::make_unique<PortAudioStream>(stream, channels);
}
