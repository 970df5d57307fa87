#include <doctest/doctest.h>
#include "dedup.hpp"
#include "test_helpers.hpp"

using namespace gifpress;
using namespace gifpress::test;

TEST_CASE("frame_difference is the mean absolute channel difference")
{
    Frame a = solid_frame(2, 2, 10, 20, 30);
    Frame b = solid_frame(2, 2, 14, 20, 30);

    // one channel of four differs by 4 on every pixel
    CHECK(frame_difference(a, b) == doctest::Approx(1.0));
    CHECK(frame_difference(a, a) == 0.0);

    Frame c = solid_frame(3, 2, 10, 20, 30);
    CHECK(frame_difference(a, c) == FRAME_DIFF_INCOMPARABLE);
}

TEST_CASE("identical frames collapse into one with the summed delay")
{
    std::vector<Frame> frames(10, solid_frame(4, 4, 200, 100, 50, 5));

    std::vector<Frame> out;
    CompressionError error;
    REQUIRE(dedupe_frames(frames, 10, out, error));

    REQUIRE(out.size() == 1);
    CHECK(out[0].delay == 50);
    CHECK(out[0].data == frames[0].data);
}

TEST_CASE("dedup preserves total duration and order")
{
    std::vector<Frame> frames;
    frames.push_back(solid_frame(4, 4, 0, 0, 0, 3));
    frames.push_back(solid_frame(4, 4, 2, 0, 0, 7));     // close to the first
    frames.push_back(solid_frame(4, 4, 255, 255, 255, 11));
    frames.push_back(solid_frame(4, 4, 250, 255, 255, 13));
    frames.push_back(solid_frame(4, 4, 0, 0, 0, 17));

    for (uint32_t threshold : {0u, 1u, 5u, 100u, 255u}) {
        std::vector<Frame> out;
        CompressionError error;
        REQUIRE(dedupe_frames(frames, threshold, out, error));
        CHECK(total_delay(out) == total_delay(frames));
        CHECK(out.front().data == frames.front().data);
    }

    std::vector<Frame> out;
    CompressionError error;
    REQUIRE(dedupe_frames(frames, 2, out, error));
    REQUIRE(out.size() == 3);
    CHECK(out[0].delay == 10);
    CHECK(out[1].delay == 24);
    CHECK(out[2].delay == 17);
}

TEST_CASE("dedup is idempotent at a fixed threshold")
{
    std::vector<Frame> frames;
    for (uint8_t i = 0; i < 12; ++i) {
        frames.push_back(solid_frame(3, 3, static_cast<uint8_t>(i * 9), 40, 40, 4));
    }

    std::vector<Frame> once;
    std::vector<Frame> twice;
    CompressionError error;
    REQUIRE(dedupe_frames(frames, 10, once, error));
    REQUIRE(dedupe_frames(once, 10, twice, error));

    REQUIRE(once.size() == twice.size());
    for (size_t i = 0; i < once.size(); ++i) {
        CHECK(once[i].delay == twice[i].delay);
        CHECK(once[i].data == twice[i].data);
    }
}

TEST_CASE("frames with different transparency flags are never merged")
{
    Frame a = solid_frame(2, 2, 0, 0, 0);
    Frame b = a;
    b.transparent = true;

    std::vector<Frame> out;
    CompressionError error;
    REQUIRE(dedupe_frames({a, b}, 255, out, error));
    CHECK(out.size() == 2);
}

TEST_CASE("dedup reports delay overflow instead of truncating")
{
    std::vector<Frame> frames(2, solid_frame(2, 2, 1, 2, 3, 40000));

    std::vector<Frame> out;
    CompressionError error;
    CHECK_FALSE(dedupe_frames(frames, 0, out, error));
    CHECK(error.kind == ErrorKind::DELAY_OVERFLOW);
}

TEST_CASE("dedup rejects thresholds above 255")
{
    std::vector<Frame> out;
    CompressionError error;
    CHECK_FALSE(dedupe_frames({solid_frame(1, 1, 0, 0, 0)}, 256, out, error));
    CHECK(error.kind == ErrorKind::INVALID_PARAMETER);
}
