#pragma once

#include "platform/audio_host.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class DeviceClass { External, BuiltIn, Unknown };

using DeviceClassifier = std::function<DeviceClass(const std::string& name)>;

// Case-insensitive substring match against two keyword sets. External
// keywords win over built-in ones; anything else is Unknown.
class KeywordClassifier {
public:
    KeywordClassifier();
    KeywordClassifier(std::vector<std::string> extra_external,
                      std::vector<std::string> extra_builtin);

    DeviceClass operator()(const std::string& name) const;

private:
    std::vector<std::string> external_;
    std::vector<std::string> builtin_;
};

struct DeviceChoice {
    std::optional<DeviceDescriptor> device; // empty: use the system default
    uint32_t sample_rate = 0;
    size_t frames_per_buffer = 0;
};

const char* to_string(DeviceClass c);

class DeviceSelector {
public:
    explicit DeviceSelector(AudioHost& host, DeviceClassifier classifier = KeywordClassifier{},
                            bool verbose = false);

    // Enumerates devices afresh on every call. Prefers devices that capture at
    // `target_rate` directly; otherwise the first device that accepts its own
    // native rate, with the buffer scaled to keep the same read duration.
    DeviceChoice select(uint32_t target_rate, uint16_t channels, size_t base_buffer_size);

    DeviceClass classify(const std::string& name) const { return classifier_(name); }

private:
    void log(const std::string& msg);

    AudioHost& host_;
    DeviceClassifier classifier_;
    bool verbose_;
};
