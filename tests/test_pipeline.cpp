#include <doctest/doctest.h>
#include "pipeline.hpp"
#include "test_helpers.hpp"
#include <deque>
#include <utility>

using namespace gifpress;
using namespace gifpress::test;

namespace {

// Size oracle returning a scripted sequence of sizes (the last one repeats)
class ScriptedEncoder : public AnimationEncoder {
public:
    explicit ScriptedEncoder(std::deque<size_t> sizes) : calls(0), sizes_(std::move(sizes)) {}

    bool encode(const Animation&, std::vector<uint8_t>& output) override
    {
        ++calls;
        const size_t size = sizes_.front();
        if (sizes_.size() > 1) {
            sizes_.pop_front();
        }
        output.assign(size, 0x47);
        return true;
    }

    const std::string& last_error() const override { return error_; }

    uint32_t calls;

private:
    std::deque<size_t> sizes_;
    std::string error_;
};

// Fails on the n-th call (1-based)
class FailingEncoder : public AnimationEncoder {
public:
    explicit FailingEncoder(uint32_t fail_on) : fail_on_(fail_on), calls_(0), error_("frame 0 exceeds canvas") {}

    bool encode(const Animation&, std::vector<uint8_t>& output) override
    {
        if (++calls_ == fail_on_) {
            return false;
        }
        output.assign(100, 0);
        return true;
    }

    const std::string& last_error() const override { return error_; }

private:
    uint32_t fail_on_;
    uint32_t calls_;
    std::string error_;
};

Animation small_animation(size_t frames)
{
    Animation animation(4, 4);
    for (size_t i = 0; i < frames; ++i) {
        animation.add_frame(gradient_frame(4, 4, static_cast<uint8_t>(i * 50)));
    }
    return animation;
}

} // anonymous namespace

TEST_CASE("pipeline stops at the first stage that reaches the target")
{
    ScriptedEncoder encoder({1000, 400});
    CompressionPipeline pipeline(encoder);

    CompressionResult result;
    CompressionError error;
    REQUIRE(pipeline.compress(small_animation(3), 50, result, error));

    CHECK(result.state == PipelineState::CONVERGED);
    CHECK(result.achieved_percent == doctest::Approx(40.0));
    REQUIRE(result.stages_applied.size() == 1);
    CHECK(result.stages_applied[0] == "Dedup(10)");
    CHECK(result.initial_size == 1000);
    CHECK(result.target_size == 500);
    CHECK(result.final_size == 400);
    CHECK(result.encoded.size() == 400);
    CHECK(encoder.calls == 2);
}

TEST_CASE("pipeline runs every stage when the target is out of reach")
{
    ScriptedEncoder encoder({100});
    CompressionPipeline pipeline(encoder);

    Animation tiny(1, 1);
    tiny.add_frame(solid_frame(1, 1, 12, 34, 56));

    CompressionResult result;
    CompressionError error;
    REQUIRE(pipeline.compress(tiny, 1, result, error));

    CHECK(result.state == PipelineState::EXHAUSTED);
    CHECK(result.stages_applied.size() == 10);
    CHECK(result.stage_stats.size() == 10);
    CHECK(result.achieved_percent == doctest::Approx(100.0));
    CHECK(result.animation.frame_count() == 1);
    CHECK(encoder.calls == 11);
}

TEST_CASE("empty animation fails before any measurement")
{
    ScriptedEncoder encoder({100});
    CompressionPipeline pipeline(encoder);

    CompressionResult result;
    CompressionError error;
    CHECK_FALSE(pipeline.compress(Animation(4, 4), 50, result, error));
    CHECK(error.kind == ErrorKind::EMPTY_ANIMATION);
    CHECK(encoder.calls == 0);
}

TEST_CASE("target percent outside [1, 99] is rejected")
{
    ScriptedEncoder encoder({100});
    CompressionPipeline pipeline(encoder);

    CompressionResult result;
    for (uint32_t target : {0u, 100u, 150u}) {
        CompressionError error;
        CHECK_FALSE(pipeline.compress(small_animation(1), target, result, error));
        CHECK(error.kind == ErrorKind::INVALID_TARGET);
    }
    CHECK(encoder.calls == 0);
}

TEST_CASE("misconfigured stage is reported before any measurement")
{
    ScriptedEncoder encoder({100});
    PipelineOptions options;
    options.stages = {Stage::dedup(10), Stage::quantize(1)};
    CompressionPipeline pipeline(encoder, options);

    CompressionResult result;
    CompressionError error;
    CHECK_FALSE(pipeline.compress(small_animation(2), 50, result, error));
    CHECK(error.kind == ErrorKind::INVALID_PARAMETER);
    CHECK(encoder.calls == 0);
}

TEST_CASE("encoder failure propagates its message unmodified")
{
    FailingEncoder first(1);
    CompressionPipeline pipeline(first);

    CompressionResult result;
    CompressionError error;
    CHECK_FALSE(pipeline.compress(small_animation(2), 50, result, error));
    CHECK(error.kind == ErrorKind::ENCODE_PROBE_FAILURE);
    CHECK(error.message == "frame 0 exceeds canvas");

    FailingEncoder later(3);
    CompressionPipeline pipeline2(later);
    CompressionError error2;
    CHECK_FALSE(pipeline2.compress(small_animation(2), 50, result, error2));
    CHECK(error2.kind == ErrorKind::ENCODE_PROBE_FAILURE);
    CHECK(error2.message == "frame 0 exceeds canvas");
}

TEST_CASE("zero-byte initial encoding is a probe failure")
{
    ScriptedEncoder encoder({0});
    CompressionPipeline pipeline(encoder);

    CompressionResult result;
    CompressionError error;
    CHECK_FALSE(pipeline.compress(small_animation(1), 50, result, error));
    CHECK(error.kind == ErrorKind::ENCODE_PROBE_FAILURE);
}

TEST_CASE("cancellation returns the last measured animation")
{
    ScriptedEncoder encoder({1000, 900, 800});
    PipelineOptions options;
    int checks = 0;
    options.cancel_requested = [&checks]() { return ++checks > 2; };
    CompressionPipeline pipeline(encoder, options);

    CompressionResult result;
    CompressionError error;
    REQUIRE(pipeline.compress(small_animation(3), 10, result, error));

    CHECK(result.state == PipelineState::CANCELLED);
    CHECK(result.stages_applied.size() == 2);
    CHECK(result.final_size == 800);
    CHECK(result.achieved_percent == doctest::Approx(80.0));
    CHECK(result.animation.has_palette);
    CHECK(encoder.calls == 3);
}

TEST_CASE("stage statistics track every applied stage")
{
    ScriptedEncoder encoder({1000, 950, 700});
    PipelineOptions options;
    options.stages = {Stage::quantize(8), Stage::simplify(60)};
    CompressionPipeline pipeline(encoder, options);

    CompressionResult result;
    CompressionError error;
    REQUIRE(pipeline.compress(small_animation(2), 50, result, error));

    CHECK(result.state == PipelineState::EXHAUSTED);
    REQUIRE(result.stage_stats.size() == 2);
    CHECK(result.stage_stats[0].descriptor == "Quantize(8)");
    CHECK(result.stage_stats[0].palette_size <= 8);
    CHECK(result.stage_stats[1].size_bytes == 700);
    CHECK(result.stage_stats[1].percent_of_initial == doctest::Approx(70.0));
    CHECK(result.to_json().find("\"state\": \"Exhausted\"") != std::string::npos);
}
