#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Audio {
        uint32_t sample_rate = 16000; // target rate of every saved segment
        uint16_t channels = 1;
        uint32_t chunk_size = 1024;   // frames per read at the target rate
    } audio;

    struct Vad {
        int aggressiveness = 2;
        uint32_t frame_ms = 30;
    } vad;

    struct Segmentation {
        size_t min_chunks = 50;
        size_t max_chunks = 500;
        size_t silence_chunks = 10;
    } segmentation;

    struct Storage {
        std::string temp_dir = "/data/audio/temp";
        std::string recordings_dir = "/data/audio/recordings";
        std::string history_db; // empty: <data_dir>/history.db
    } storage;

    struct Bus {
        std::string host = "127.0.0.1";
        uint16_t port = 6379;
    } bus;

    struct Capture {
        uint32_t stop_timeout_ms = 5000;
        std::vector<std::string> external_keywords;
        std::vector<std::string> builtin_keywords;
    } capture;

    static Config load(const std::string& path);
    static Config load_default();
};
