#include <doctest/doctest.h>
#include "stage.hpp"
#include "test_helpers.hpp"

using namespace gifpress;
using namespace gifpress::test;

TEST_CASE("reference stage list")
{
    const std::vector<Stage> stages = reference_stages();
    const char* expected[] = {
        "Dedup(10)", "Quantize(128)", "Simplify(80)", "Quantize(64)", "Simplify(60)",
        "Quantize(32)", "Simplify(40)", "Dedup(5)", "Quantize(16)", "DropFrames(0.70)"
    };

    REQUIRE(stages.size() == 10);
    for (size_t i = 0; i < stages.size(); ++i) {
        CHECK(stages[i].describe() == expected[i]);
        std::string error;
        CHECK(stages[i].validate(error));
    }
}

TEST_CASE("stage descriptors parse back to the same stage")
{
    for (const Stage& stage : reference_stages()) {
        Stage parsed;
        std::string error;
        REQUIRE(parse_stage(stage.describe(), parsed, error));
        CHECK(parsed == stage);
    }

    Stage parsed;
    std::string error;
    REQUIRE(parse_stage("  quantize( 48 ) ", parsed, error));
    CHECK(parsed == Stage::quantize(48));
}

TEST_CASE("malformed stage descriptors are rejected")
{
    Stage parsed;
    std::string error;
    CHECK_FALSE(parse_stage("Quantize", parsed, error));
    CHECK_FALSE(parse_stage("Blur(3)", parsed, error));
    CHECK_FALSE(parse_stage("Quantize(1)", parsed, error));
    CHECK_FALSE(parse_stage("Simplify(101)", parsed, error));
    CHECK_FALSE(parse_stage("Dedup(-1)", parsed, error));
    CHECK_FALSE(parse_stage("Dedup(4x)", parsed, error));
    CHECK_FALSE(parse_stage("DropFrames(0)", parsed, error));
    CHECK_FALSE(error.empty());
}

TEST_CASE("quantize stage installs the shared palette and simplify keeps it valid")
{
    Animation input(8, 8);
    input.add_frame(gradient_frame(8, 8));
    input.add_frame(gradient_frame(8, 8, 30));

    Animation quantized;
    CompressionError error;
    REQUIRE(apply_stage(Stage::quantize(16), input, StageContext(), quantized, error));
    CHECK(quantized.has_palette);
    CHECK(quantized.palette.size() <= 16);
    CHECK_FALSE(input.has_palette);

    Animation simplified;
    REQUIRE(apply_stage(Stage::simplify(40), quantized, StageContext(), simplified, error));
    REQUIRE(simplified.has_palette);
    for (const auto& frame : simplified.frames) {
        for (size_t i = 0; i < frame.pixel_count(); ++i) {
            const uint8_t* p = frame.pixel(i);
            CHECK(simplified.palette.contains(Rgb(p[0], p[1], p[2])));
        }
    }
}

TEST_CASE("apply_stage rejects a misconfigured stage")
{
    Animation input(1, 1);
    input.add_frame(solid_frame(1, 1, 0, 0, 0));

    Animation out;
    CompressionError error;
    CHECK_FALSE(apply_stage(Stage::quantize(300), input, StageContext(), out, error));
    CHECK(error.kind == ErrorKind::INVALID_PARAMETER);
}
