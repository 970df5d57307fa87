#include <doctest/doctest.h>
#include "config.hpp"
#include <cstdio>
#include <fstream>

using namespace gifpress;

TEST_CASE("defaults use the reference stages")
{
    CompressionConfig config;
    CHECK(config.target_percent == 50);
    CHECK(config.stages == reference_stages());
    CHECK(config.quantize_seed == 1);
    CHECK(config.alpha_cutoff == 128);

    // no input or output yet
    CHECK_FALSE(config.validate());
    config.input = "in.gif";
    config.output = "out.gif";
    CHECK(config.validate());
}

TEST_CASE("configuration loads from a YAML node")
{
    const YAML::Node node = YAML::Load(
        "input: clip.gif\n"
        "output: small.gif\n"
        "target_percent: 30\n"
        "stages: [\"Dedup(4)\", \"Quantize(32)\", \"DropFrames(0.5)\"]\n"
        "quantize_seed: 7\n"
        "worker_threads: 2\n"
        "time_budget_ms: 1500\n"
        "loop_count: 3\n"
        "verbose: false\n");

    CompressionConfig config;
    REQUIRE(config.load_from_node(node));
    REQUIRE(config.validate());

    CHECK(config.input == "clip.gif");
    CHECK(config.target_percent == 30);
    REQUIRE(config.stages.size() == 3);
    CHECK(config.stages[1] == Stage::quantize(32));
    CHECK(config.stages[2] == Stage::drop_frames(0.5));
    CHECK(config.quantize_seed == 7);
    CHECK(config.stage_context().quantize_seed == 7);
    CHECK(config.worker_threads == 2);
    CHECK(config.time_budget_ms == 1500);
    CHECK(config.loop_count == 3);
    CHECK_FALSE(config.verbose);
}

TEST_CASE("bad stage descriptors and ranges fail to load or validate")
{
    CompressionConfig bad_stage;
    CHECK_FALSE(bad_stage.load_from_node(YAML::Load("stages: [\"Quantize(999)\"]\n")));

    CompressionConfig bad_target;
    REQUIRE(bad_target.load_from_node(YAML::Load("input: a.gif\noutput: b.gif\ntarget_percent: 100\n")));
    CHECK_FALSE(bad_target.validate());

    CompressionConfig both_sources;
    REQUIRE(both_sources.load_from_node(YAML::Load("input: a.gif\nframes_dir: f\noutput: b.gif\n")));
    CHECK_FALSE(both_sources.validate());
}

TEST_CASE("profiles override the shared root values")
{
    const std::string path = "gifpress_test_profiles.yaml";
    {
        std::ofstream ofs(path);
        ofs << "input: clip.gif\n"
               "output: out.gif\n"
               "target_percent: 60\n"
               "profiles:\n"
               "  aggressive:\n"
               "    target_percent: 20\n"
               "    stages: [\"Quantize(16)\", \"DropFrames(0.5)\"]\n";
    }

    CompressionConfig root;
    REQUIRE(root.load_from_yaml(path));
    CHECK(root.target_percent == 60);
    CHECK(root.stages == reference_stages());

    CompressionConfig profiled;
    REQUIRE(profiled.load_from_yaml(path, "aggressive"));
    CHECK(profiled.input == "clip.gif");
    CHECK(profiled.target_percent == 20);
    CHECK(profiled.stages.size() == 2);

    CompressionConfig missing;
    CHECK_FALSE(missing.load_from_yaml(path, "nonexistent"));

    std::remove(path.c_str());
}
