#include "device_selector.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <print>

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::ranges::any_of(needles, [&](const std::string& kw) {
        return !kw.empty() && haystack.find(kw) != std::string::npos;
    });
}

} // namespace

KeywordClassifier::KeywordClassifier()
    : external_{"usb", "uac", "respeaker", "jabra", "samson", "blue", "yeti", "rode",
                "fifine", "tonor", "boya", "maono", "external", "webcam", "camera"},
      builtin_{"hdmi", "built-in", "bcm", "broadcom", "headphone", "analog", "spdif", "iec958"} {}

KeywordClassifier::KeywordClassifier(std::vector<std::string> extra_external,
                                     std::vector<std::string> extra_builtin)
    : KeywordClassifier() {
    for (auto& kw : extra_external) external_.push_back(lower(std::move(kw)));
    for (auto& kw : extra_builtin) builtin_.push_back(lower(std::move(kw)));
}

DeviceClass KeywordClassifier::operator()(const std::string& name) const {
    auto low = lower(name);
    if (contains_any(low, external_)) return DeviceClass::External;
    if (contains_any(low, builtin_)) return DeviceClass::BuiltIn;
    return DeviceClass::Unknown;
}

const char* to_string(DeviceClass c) {
    switch (c) {
        case DeviceClass::External: return "external";
        case DeviceClass::BuiltIn: return "built-in";
        case DeviceClass::Unknown: return "unknown";
    }
    return "unknown";
}

DeviceSelector::DeviceSelector(AudioHost& host, DeviceClassifier classifier, bool verbose)
    : host_(host), classifier_(std::move(classifier)), verbose_(verbose) {}

DeviceChoice DeviceSelector::select(uint32_t target_rate, uint16_t channels,
                                    size_t base_buffer_size) {
    if (target_rate == 0) return {std::nullopt, target_rate, base_buffer_size};

    std::vector<DeviceDescriptor> candidates;
    for (auto& d : host_.input_devices()) {
        if (d.max_input_channels > 0) candidates.push_back(std::move(d));
    }

    if (candidates.empty()) {
        std::println(stderr, "audio: no input devices found, using system default");
        return {std::nullopt, target_rate, base_buffer_size};
    }

    for (auto& c : candidates) {
        log(std::format("input device [{}] {} (rate={}, class={})", c.index, c.name,
                        c.default_sample_rate, to_string(classifier_(c.name))));
    }

    // Unknown names count as external: better to try a real mic than skip it.
    std::ranges::stable_sort(candidates, {}, [this](const DeviceDescriptor& d) {
        return classifier_(d.name) == DeviceClass::BuiltIn ? 1 : 0;
    });

    for (auto& c : candidates) {
        if (host_.supports(c.index, target_rate, channels)) {
            log(std::format("selected [{}] {} at {}Hz", c.index, c.name, target_rate));
            return {c, target_rate, base_buffer_size};
        }
    }

    for (auto& c : candidates) {
        auto native = static_cast<uint32_t>(std::lround(c.default_sample_rate));
        if (native == 0) continue;
        if (host_.supports(c.index, native, channels)) {
            size_t buffer = static_cast<size_t>(
                static_cast<uint64_t>(base_buffer_size) * native / target_rate);
            log(std::format("selected [{}] {} at native {}Hz (resampling to {}Hz, buffer {})",
                            c.index, c.name, native, target_rate, buffer));
            return {c, native, buffer};
        }
    }

    std::println(stderr, "audio: warning: no device supports {}Hz or its native rate, "
                         "falling back to system default", target_rate);
    return {std::nullopt, target_rate, base_buffer_size};
}

void DeviceSelector::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetcap] {}", msg);
    }
}
