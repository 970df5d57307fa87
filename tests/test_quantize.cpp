#include <doctest/doctest.h>
#include "quantize.hpp"
#include "test_helpers.hpp"

using namespace gifpress;
using namespace gifpress::test;

namespace {

std::vector<Frame> four_color_frames()
{
    Frame a(2, 1);
    set_pixel(a, 0, 0, 255, 0, 0);      // red
    set_pixel(a, 1, 0, 0, 0, 255);      // blue
    Frame b(2, 1);
    set_pixel(b, 0, 0, 0, 255, 0);      // green
    set_pixel(b, 1, 0, 255, 255, 0);    // yellow
    return {a, b};
}

} // anonymous namespace

TEST_CASE("four colors quantized to two map to their nearer entry")
{
    const std::vector<Frame> frames = four_color_frames();

    std::vector<Frame> out;
    Palette palette;
    CompressionError error;
    REQUIRE(quantize_frames(frames, QuantizerParams(2), false, out, palette, error));

    CHECK(palette.size() == 2);
    CHECK_FALSE(palette.has_transparent);

    for (size_t f = 0; f < frames.size(); ++f) {
        for (size_t i = 0; i < frames[f].pixel_count(); ++i) {
            const uint8_t* src = frames[f].pixel(i);
            const uint8_t* dst = out[f].pixel(i);
            const Rgb expected = palette.colors[palette.nearest(Rgb(src[0], src[1], src[2]))];
            CHECK(Rgb(dst[0], dst[1], dst[2]) == expected);
        }
    }
}

TEST_CASE("quantized pixels are palette members within the bound")
{
    const std::vector<Frame> frames = {gradient_frame(16, 16), gradient_frame(16, 16, 40)};

    for (uint32_t max_colors : {2u, 16u, 64u, 256u}) {
        std::vector<Frame> out;
        Palette palette;
        CompressionError error;
        REQUIRE(quantize_frames(frames, QuantizerParams(max_colors), false, out, palette, error));

        CHECK(palette.size() <= max_colors);
        for (const auto& frame : out) {
            for (size_t i = 0; i < frame.pixel_count(); ++i) {
                const uint8_t* p = frame.pixel(i);
                CHECK(palette.contains(Rgb(p[0], p[1], p[2])));
            }
        }
    }
}

TEST_CASE("few distinct colors are kept exactly")
{
    const std::vector<Frame> frames = four_color_frames();

    std::vector<Frame> out;
    Palette palette;
    CompressionError error;
    REQUIRE(quantize_frames(frames, QuantizerParams(16), false, out, palette, error));

    CHECK(palette.colors.size() == 4);
    for (size_t f = 0; f < frames.size(); ++f) {
        CHECK(out[f].data == frames[f].data);
    }
}

TEST_CASE("the same seed gives the same palette")
{
    const std::vector<Frame> frames = {gradient_frame(24, 24), gradient_frame(24, 24, 90)};

    std::vector<Frame> out1;
    std::vector<Frame> out2;
    Palette p1;
    Palette p2;
    CompressionError error;
    REQUIRE(quantize_frames(frames, QuantizerParams(8, 42), false, out1, p1, error));
    REQUIRE(quantize_frames(frames, QuantizerParams(8, 42), false, out2, p2, error));

    CHECK(p1.colors == p2.colors);
    CHECK(out1[0].data == out2[0].data);
    CHECK(out1[1].data == out2[1].data);
}

TEST_CASE("transparent pixels use the reserved slot")
{
    Frame f(3, 1);
    set_pixel(f, 0, 0, 10, 20, 30, 255);
    set_pixel(f, 1, 0, 90, 90, 90, 0);
    set_pixel(f, 2, 0, 200, 10, 10, 200);
    f.transparent = true;

    std::vector<Frame> out;
    Palette palette;
    CompressionError error;
    REQUIRE(quantize_frames({f}, QuantizerParams(2), true, out, palette, error));

    CHECK(palette.has_transparent);
    CHECK(palette.size() <= 2);
    CHECK(palette.colors.size() == 1);

    const uint8_t* hidden = out[0].pixel(1);
    CHECK(hidden[0] == 0);
    CHECK(hidden[3] == 0);

    // opaque pixels become fully opaque palette colors
    CHECK(out[0].pixel(0)[3] == 255);
    CHECK(out[0].pixel(2)[3] == 255);
    CHECK(out[0].transparent);
}

TEST_CASE("max_colors outside [2, 256] is rejected")
{
    const std::vector<Frame> frames = four_color_frames();
    std::vector<Frame> out;
    Palette palette;

    CompressionError low;
    CHECK_FALSE(quantize_frames(frames, QuantizerParams(1), false, out, palette, low));
    CHECK(low.kind == ErrorKind::INVALID_PARAMETER);

    CompressionError high;
    CHECK_FALSE(quantize_frames(frames, QuantizerParams(257), false, out, palette, high));
    CHECK(high.kind == ErrorKind::INVALID_PARAMETER);
}

TEST_CASE("large histograms are bucketed below the cluster limit")
{
    std::vector<ColorSample> samples;
    for (uint32_t i = 0; i < 70000; ++i) {
        samples.emplace_back(Rgb(static_cast<uint8_t>(i), static_cast<uint8_t>(i >> 8), static_cast<uint8_t>(i >> 16)), 1);
    }

    const std::vector<ColorSample> buckets = bucket_color_histogram(samples);
    CHECK(buckets.size() <= MAX_CLUSTER_SAMPLES);

    uint64_t weight = 0;
    for (const auto& b : buckets) {
        weight += b.weight;
    }
    CHECK(weight == samples.size());
}
