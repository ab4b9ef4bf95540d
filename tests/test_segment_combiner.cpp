#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "segment_combiner.hpp"
#include "wav.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

void write_segment(const fs::path& dir, const std::string& name, size_t frames, int16_t value,
                   uint32_t rate = 16000) {
    fs::create_directories(dir);
    std::vector<int16_t> samples(frames, value);
    REQUIRE(wav::write_file(dir / name, samples, {.sample_rate = rate, .channels = 1}).has_value());
}

} // namespace

TEST_CASE("SegmentCombiner", "[segments]") {
    fakes::TmpDir tmp("combiner");
    auto temp_dir = tmp.path / "temp";
    auto rec_dir = tmp.path / "recordings";
    SegmentCombiner combiner(temp_dir, rec_dir);

    SECTION("NoSegmentsWritesNothing") {
        auto res = combiner.combine("empty");
        REQUIRE(res.has_value());
        REQUIRE_FALSE(res->has_value());
        REQUIRE_FALSE(fs::exists(rec_dir));

        fs::create_directories(temp_dir / "empty");
        res = combiner.combine("empty");
        REQUIRE(res.has_value());
        REQUIRE_FALSE(res->has_value());
        REQUIRE_FALSE(fs::exists(rec_dir / "empty.wav"));
    }

    SECTION("ConcatenatesInOrderAndCleansUp") {
        auto dir = temp_dir / "meeting";
        write_segment(dir, "segment_0000.wav", 100, 1);
        write_segment(dir, "segment_0001.wav", 200, 2);
        write_segment(dir, "segment_0002.wav", 300, 3);

        auto res = combiner.combine("meeting");
        REQUIRE(res.has_value());
        REQUIRE(res->has_value());

        auto& rec = **res;
        REQUIRE(rec.path == rec_dir / "meeting.wav");
        REQUIRE(rec.segments == 3);
        REQUIRE(rec.frames == 600);
        REQUIRE(rec.sample_rate == 16000);
        REQUIRE(rec.duration_s() == 600.0 / 16000.0);

        auto clip = wav::read_file(rec.path);
        REQUIRE(clip.has_value());
        REQUIRE(clip->samples.size() == 600);
        REQUIRE(clip->samples[0] == 1);
        REQUIRE(clip->samples[100] == 2);
        REQUIRE(clip->samples[299] == 2);
        REQUIRE(clip->samples[300] == 3);

        REQUIRE_FALSE(fs::exists(dir));
    }

    SECTION("NumericOrder") {
        auto dir = temp_dir / "order";
        write_segment(dir, "segment_0010.wav", 1, 10);
        write_segment(dir, "segment_0002.wav", 1, 2);
        write_segment(dir, "segment_0001.wav", 1, 1);
        std::ofstream(dir / "notes.txt") << "not a segment";

        auto list = SegmentCombiner::list_segments(dir);
        REQUIRE(list.size() == 3);
        REQUIRE(list[0].filename() == "segment_0001.wav");
        REQUIRE(list[1].filename() == "segment_0002.wav");
        REQUIRE(list[2].filename() == "segment_0010.wav");

        auto res = combiner.combine("order");
        REQUIRE(res.has_value());
        auto clip = wav::read_file((*res)->path);
        REQUIRE(clip->samples == std::vector<int16_t>{1, 2, 10});

        // Unrelated files keep the directory alive.
        REQUIRE(fs::exists(dir / "notes.txt"));
        REQUIRE_FALSE(fs::exists(dir / "segment_0001.wav"));
    }

    SECTION("FormatMismatchKeepsSegments") {
        auto dir = temp_dir / "mixed";
        write_segment(dir, "segment_0000.wav", 100, 1, 16000);
        write_segment(dir, "segment_0001.wav", 100, 1, 44100);

        auto res = combiner.combine("mixed");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(fs::exists(dir / "segment_0000.wav"));
        REQUIRE(fs::exists(dir / "segment_0001.wav"));
        REQUIRE_FALSE(fs::exists(rec_dir / "mixed.wav"));
    }

    SECTION("CorruptSegmentKeepsSegments") {
        auto dir = temp_dir / "corrupt";
        write_segment(dir, "segment_0000.wav", 100, 1);
        std::ofstream(dir / "segment_0001.wav") << "garbage";

        REQUIRE_FALSE(combiner.combine("corrupt").has_value());
        REQUIRE(fs::exists(dir / "segment_0000.wav"));
    }
}
