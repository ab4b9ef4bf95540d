#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "wav.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.insert(out.end(), reinterpret_cast<uint8_t*>(&v), reinterpret_cast<uint8_t*>(&v) + 2);
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.insert(out.end(), reinterpret_cast<uint8_t*>(&v), reinterpret_cast<uint8_t*>(&v) + 4);
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    const wav::Format fmt{.sample_rate = 16000, .channels = 1};
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto bytes = wav::encode(samples, fmt);
        REQUIRE(read_tag(bytes.data()) == "RIFF");
        REQUIRE(read_tag(bytes.data() + 8) == "WAVE");
        REQUIRE(read_tag(bytes.data() + 12) == "fmt ");
        REQUIRE(read_tag(bytes.data() + 36) == "data");
    }

    SECTION("HeaderFields") {
        auto bytes = wav::encode(samples, fmt);
        REQUIRE(bytes.size() == wav::HEADER_SIZE + samples.size() * 2);

        REQUIRE(read_u32(bytes.data() + 16) == 16);
        REQUIRE(read_u16(bytes.data() + 20) == 1);
        REQUIRE(read_u16(bytes.data() + 22) == 1);
        REQUIRE(read_u32(bytes.data() + 24) == 16000);
        REQUIRE(read_u32(bytes.data() + 28) == 16000 * 2);
        REQUIRE(read_u16(bytes.data() + 32) == 2);
        REQUIRE(read_u16(bytes.data() + 34) == 16);

        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(bytes.data() + 40) == data_size);
        REQUIRE(read_u32(bytes.data() + 4) == 36 + data_size);
    }

    SECTION("StereoBlockAlign") {
        wav::Format stereo{.sample_rate = 48000, .channels = 2};
        auto bytes = wav::encode(std::vector<int16_t>{1, 2, 3, 4}, stereo);
        REQUIRE(read_u16(bytes.data() + 22) == 2);
        REQUIRE(read_u16(bytes.data() + 32) == 4);
        REQUIRE(read_u32(bytes.data() + 28) == 48000 * 4);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto bytes = wav::encode(empty, fmt);
        REQUIRE(bytes.size() == 44);
        REQUIRE(read_u32(bytes.data() + 40) == 0);
    }
}

TEST_CASE("wav::decode", "[wav]") {

    SECTION("ReadsEncodedClip") {
        std::vector<int16_t> samples = {5, -5, 1000, -1000, 0, 42};
        auto clip = wav::decode(wav::encode(samples, {.sample_rate = 8000, .channels = 2}));
        REQUIRE(clip.has_value());
        REQUIRE(clip->format.sample_rate == 8000);
        REQUIRE(clip->format.channels == 2);
        REQUIRE(clip->samples == samples);
        REQUIRE(clip->frames() == 3);
    }

    SECTION("SkipsUnknownChunks") {
        std::vector<uint8_t> bytes;
        put_tag(bytes, "RIFF");
        put_u32(bytes, 0);
        put_tag(bytes, "WAVE");
        put_tag(bytes, "fmt ");
        put_u32(bytes, 16);
        put_u16(bytes, 1);
        put_u16(bytes, 1);
        put_u32(bytes, 22050);
        put_u32(bytes, 44100);
        put_u16(bytes, 2);
        put_u16(bytes, 16);
        put_tag(bytes, "LIST");
        put_u32(bytes, 3); // odd size, padded to 4
        bytes.insert(bytes.end(), {uint8_t('a'), uint8_t('b'), uint8_t('c'), uint8_t(0)});
        put_tag(bytes, "data");
        put_u32(bytes, 4);
        put_u16(bytes, 7);
        put_u16(bytes, 0xFFFF);

        auto clip = wav::decode(bytes);
        REQUIRE(clip.has_value());
        REQUIRE(clip->format.sample_rate == 22050);
        REQUIRE(clip->samples == std::vector<int16_t>{7, -1});
    }

    SECTION("RejectsNonPcm") {
        auto bytes = wav::encode(std::vector<int16_t>{1, 2}, {});
        bytes[20] = 3; // IEEE float
        REQUIRE_FALSE(wav::decode(bytes).has_value());
    }

    SECTION("RejectsGarbage") {
        std::vector<uint8_t> bytes(64, 0xAB);
        REQUIRE_FALSE(wav::decode(bytes).has_value());
    }
}

TEST_CASE("wav files", "[wav]") {
    fakes::TmpDir tmp("wav");
    auto path = tmp.path / "clip.wav";

    SECTION("WriteReadAndProbe") {
        std::vector<int16_t> samples(3000, 123);
        REQUIRE(wav::write_file(path, samples, {.sample_rate = 16000, .channels = 1}).has_value());

        auto info = wav::probe(path);
        REQUIRE(info.has_value());
        REQUIRE(info->first.sample_rate == 16000);
        REQUIRE(info->second == 3000);

        auto clip = wav::read_file(path);
        REQUIRE(clip.has_value());
        REQUIRE(clip->samples == samples);
    }

    SECTION("ProbeMissingFile") {
        REQUIRE_FALSE(wav::probe(tmp.path / "missing.wav").has_value());
    }

    SECTION("WriteIntoMissingDirectoryFails") {
        auto res = wav::write_file(tmp.path / "no" / "such" / "dir.wav", std::vector<int16_t>{1}, {});
        REQUIRE_FALSE(res.has_value());
    }
}
