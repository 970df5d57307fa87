#include <doctest/doctest.h>
#include "png_io.hpp"
#include "test_helpers.hpp"
#include <cstdio>
#include <string>
#include <unistd.h>

using namespace gifpress;
using namespace gifpress::test;

TEST_CASE("PNG sequence export and import round trip")
{
    const std::string dir = "gifpress_test_frames";

    Animation animation(5, 3);
    animation.add_frame(gradient_frame(5, 3));
    Frame holed = solid_frame(5, 3, 40, 80, 120);
    set_pixel(holed, 2, 1, 0, 0, 0, 0);
    holed.transparent = true;
    animation.add_frame(holed);

    std::string error;
    REQUIRE(write_png_sequence(dir, animation, error));

    Animation loaded;
    REQUIRE(load_png_sequence(dir, 6, loaded, error));

    CHECK(loaded.width == 5);
    CHECK(loaded.height == 3);
    REQUIRE(loaded.frame_count() == 2);
    CHECK(loaded.frames[0].data == animation.frames[0].data);
    CHECK(loaded.frames[1].data == animation.frames[1].data);
    CHECK(loaded.frames[0].delay == 6);
    CHECK_FALSE(loaded.frames[0].transparent);
    CHECK(loaded.frames[1].transparent);

    std::remove((dir + "/frame_000000.png").c_str());
    std::remove((dir + "/frame_000001.png").c_str());
    rmdir(dir.c_str());
}

TEST_CASE("missing frame directory is reported")
{
    Animation loaded;
    std::string error;
    CHECK_FALSE(load_png_sequence("gifpress_no_such_dir", 10, loaded, error));
    CHECK_FALSE(error.empty());
}
