#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("channels")) cfg.audio.channels = a["channels"].get<uint16_t>();
            if (a.contains("chunk_size")) cfg.audio.chunk_size = a["chunk_size"].get<uint32_t>();
        }

        if (j.contains("vad")) {
            auto& v = j["vad"];
            if (v.contains("aggressiveness")) cfg.vad.aggressiveness = v["aggressiveness"].get<int>();
            if (v.contains("frame_ms")) cfg.vad.frame_ms = v["frame_ms"].get<uint32_t>();
        }

        if (j.contains("segmentation")) {
            auto& s = j["segmentation"];
            if (s.contains("min_chunks")) cfg.segmentation.min_chunks = s["min_chunks"].get<size_t>();
            if (s.contains("max_chunks")) cfg.segmentation.max_chunks = s["max_chunks"].get<size_t>();
            if (s.contains("silence_chunks")) cfg.segmentation.silence_chunks = s["silence_chunks"].get<size_t>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("temp_dir")) cfg.storage.temp_dir = s["temp_dir"].get<std::string>();
            if (s.contains("recordings_dir")) cfg.storage.recordings_dir = s["recordings_dir"].get<std::string>();
            if (s.contains("history_db")) cfg.storage.history_db = s["history_db"].get<std::string>();
        }

        if (j.contains("bus")) {
            auto& b = j["bus"];
            if (b.contains("host")) cfg.bus.host = b["host"].get<std::string>();
            if (b.contains("port")) cfg.bus.port = b["port"].get<uint16_t>();
        }

        if (j.contains("capture")) {
            auto& c = j["capture"];
            if (c.contains("stop_timeout_ms")) cfg.capture.stop_timeout_ms = c["stop_timeout_ms"].get<uint32_t>();
            if (c.contains("external_keywords"))
                cfg.capture.external_keywords = c["external_keywords"].get<std::vector<std::string>>();
            if (c.contains("builtin_keywords"))
                cfg.capture.builtin_keywords = c["builtin_keywords"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.vad.aggressiveness < 0 || cfg.vad.aggressiveness > 3) {
        std::println(stderr, "config: vad.aggressiveness {} out of range, clamping", cfg.vad.aggressiveness);
        cfg.vad.aggressiveness = std::clamp(cfg.vad.aggressiveness, 0, 3);
    }
    if (cfg.vad.frame_ms != 10 && cfg.vad.frame_ms != 20 && cfg.vad.frame_ms != 30) {
        std::println(stderr, "config: vad.frame_ms {} unsupported, using 30", cfg.vad.frame_ms);
        cfg.vad.frame_ms = 30;
    }
    if (cfg.audio.channels == 0) cfg.audio.channels = 1;
    if (cfg.audio.sample_rate == 0) {
        std::println(stderr, "config: audio.sample_rate 0 invalid, using {}", Config{}.audio.sample_rate);
        cfg.audio.sample_rate = Config{}.audio.sample_rate;
    }
    if (cfg.audio.chunk_size == 0) {
        std::println(stderr, "config: audio.chunk_size 0 invalid, using {}", Config{}.audio.chunk_size);
        cfg.audio.chunk_size = Config{}.audio.chunk_size;
    }
    if (cfg.segmentation.max_chunks < cfg.segmentation.min_chunks) {
        std::println(stderr, "config: segmentation.max_chunks < min_chunks, raising to {}",
                     cfg.segmentation.min_chunks);
        cfg.segmentation.max_chunks = cfg.segmentation.min_chunks;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
