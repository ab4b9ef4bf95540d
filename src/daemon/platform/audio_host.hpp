#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Snapshot of one enumerated input device.
struct DeviceDescriptor {
    int index = -1;
    std::string name;
    double default_sample_rate = 0.0;
    int max_input_channels = 0;
};

// Blocking int16 input stream. read() is called from the capture thread
// only; stop() and close() are called by the owner once that thread has exited.
class InputStream {
public:
    virtual ~InputStream() = default;

    // Fills `out` with interleaved samples. Returns the number of frames read;
    // zero means no data was available and the call may be retried.
    // Input overflow is not an error.
    virtual std::expected<size_t, std::string> read(std::span<int16_t> out) = 0;
    virtual void stop() = 0;
    virtual void close() = 0;
};

class AudioHost {
public:
    virtual ~AudioHost() = default;
    virtual std::vector<DeviceDescriptor> input_devices() = 0;
    virtual bool supports(int device, uint32_t sample_rate, uint16_t channels) = 0;
    // An empty `device` opens the system default input.
    virtual std::expected<std::unique_ptr<InputStream>, std::string>
        open(std::optional<int> device, uint32_t sample_rate, uint16_t channels,
             size_t frames_per_buffer) = 0;
};
