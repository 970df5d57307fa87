#include <doctest/doctest.h>
#include "encoder.hpp"
#include "quantize.hpp"
#include "test_helpers.hpp"

using namespace gifpress;
using namespace gifpress::test;

TEST_CASE("GIF round trip keeps frames, delays and loop count")
{
    Animation animation(6, 4);
    animation.loop_count = 3;
    animation.add_frame(solid_frame(6, 4, 255, 0, 0, 7));
    animation.add_frame(solid_frame(6, 4, 0, 0, 255, 12));
    animation.add_frame(solid_frame(6, 4, 0, 255, 0, 30));

    GifCodec codec;
    std::vector<uint8_t> bytes;
    REQUIRE(codec.encode(animation, bytes));
    REQUIRE(bytes.size() > 6);
    CHECK(std::string(bytes.begin(), bytes.begin() + 6) == "GIF89a");

    Animation decoded;
    REQUIRE(codec.decode(bytes.data(), bytes.size(), decoded));

    CHECK(decoded.width == 6);
    CHECK(decoded.height == 4);
    CHECK(decoded.loop_count == 3);
    REQUIRE(decoded.frame_count() == 3);
    CHECK(decoded.frames[0].delay == 7);
    CHECK(decoded.frames[1].delay == 12);
    CHECK(decoded.frames[2].delay == 30);

    for (size_t f = 0; f < 3; ++f) {
        CHECK(decoded.frames[f].data == animation.frames[f].data);
    }
}

TEST_CASE("shared palette is written as the global color table")
{
    Animation animation(8, 8);
    animation.add_frame(gradient_frame(8, 8));
    animation.add_frame(gradient_frame(8, 8, 20));

    std::vector<Frame> quantized;
    Palette palette;
    CompressionError error;
    REQUIRE(quantize_frames(animation.frames, QuantizerParams(16), false, quantized, palette, error));
    animation.frames = quantized;
    animation.has_palette = true;
    animation.palette = palette;

    GifCodec codec;
    std::vector<uint8_t> bytes;
    REQUIRE(codec.encode(animation, bytes));

    Animation decoded;
    REQUIRE(codec.decode(bytes.data(), bytes.size(), decoded));
    CHECK(decoded.has_palette);
    CHECK(decoded.palette.colors.size() >= palette.colors.size());
    for (size_t f = 0; f < 2; ++f) {
        CHECK(decoded.frames[f].data == animation.frames[f].data);
    }
}

TEST_CASE("transparent pixels survive a round trip")
{
    Frame frame = solid_frame(4, 4, 10, 200, 10);
    set_pixel(frame, 1, 1, 0, 0, 0, 0);
    frame.transparent = true;

    Animation animation(4, 4);
    animation.add_frame(frame);

    GifCodec codec;
    std::vector<uint8_t> bytes;
    REQUIRE(codec.encode(animation, bytes));

    Animation decoded;
    REQUIRE(codec.decode(bytes.data(), bytes.size(), decoded));
    REQUIRE(decoded.frame_count() == 1);
    CHECK(decoded.frames[0].transparent);
    CHECK(decoded.frames[0].pixel(5)[3] == 0);
    CHECK(decoded.frames[0].pixel(0)[3] == 255);
}

TEST_CASE("frames with more than 256 colors get a quantized local table")
{
    Animation animation(32, 32);
    animation.add_frame(gradient_frame(32, 32));

    GifCodec codec;
    std::vector<uint8_t> bytes;
    REQUIRE(codec.encode(animation, bytes));

    Animation decoded;
    REQUIRE(codec.decode(bytes.data(), bytes.size(), decoded));
    CHECK(decoded.frame_count() == 1);
    CHECK(decoded.width == 32);
}

TEST_CASE("encoding an empty animation fails with a message")
{
    GifCodec codec;
    std::vector<uint8_t> bytes;
    CHECK_FALSE(codec.encode(Animation(2, 2), bytes));
    CHECK_FALSE(codec.last_error().empty());
}

TEST_CASE("decoding garbage fails")
{
    const uint8_t junk[] = {'n', 'o', 't', 'a', 'g', 'i', 'f'};
    GifCodec codec;
    Animation decoded;
    CHECK_FALSE(codec.decode(junk, sizeof(junk), decoded));
    CHECK_FALSE(codec.last_error().empty());
}
