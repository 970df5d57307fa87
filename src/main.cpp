/**
 * @file main.cpp
 * @brief Command-line interface for the gifpress compression tool
 *
 * Shrinks an animated GIF (or a directory of PNG frames) to a target
 * percentage of its encoded size with the adaptive stage pipeline.
 *
 * Usage:
 *   gifpress --config example_config.yaml
 *   gifpress --input in.gif --output out.gif --percent 40
 */

#include "pipeline.hpp"
#include "config.hpp"
#include "encoder.hpp"
#include "parallel.hpp"
#include "png_io.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>
#include <csignal>
#include <atomic>
#include <chrono>
#include <sstream>
#include <utility>

namespace {

std::atomic<bool> g_interrupted(false);

void signal_handler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

void print_usage(const char* program_name)
{
    std::cout << "gifpress - Adaptive Animated GIF Compression" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " --config <yaml_file> [--profile <name>] [options]" << std::endl;
    std::cout << "  " << program_name << " --input <gif> --output <gif> [options]" << std::endl;
    std::cout << "  " << program_name << " --info <gif>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>          Load configuration from YAML file" << std::endl;
    std::cout << "  --profile <name>         Use specific profile from config file" << std::endl;
    std::cout << "  --input <path>           Input GIF" << std::endl;
    std::cout << "  --frames-dir <dir>       Directory of PNG frames to use instead of a GIF" << std::endl;
    std::cout << "  --delay <N>              Delay of imported PNG frames (10 ms units)" << std::endl;
    std::cout << "  --output <path>          Output GIF" << std::endl;
    std::cout << "  --percent <N>            Target size in percent of the input (1-99)" << std::endl;
    std::cout << "  --stages <list>          Comma-separated stages, e.g. \"Dedup(10),Quantize(64)\"" << std::endl;
    std::cout << "  --seed <N>               Quantizer seed" << std::endl;
    std::cout << "  --threads <N>            Worker threads (0 = all cores)" << std::endl;
    std::cout << "  --time-budget-ms <N>     Stop between stages after N ms (0 = unlimited)" << std::endl;
    std::cout << "  --loop-count <N>         Override loop count (0 = infinite)" << std::endl;
    std::cout << "  --stats                  Write <output>.stats.json and <output>.stages.csv" << std::endl;
    std::cout << "  --dump-frames <dir>      Export final frames as PNGs" << std::endl;
    std::cout << "  --quiet                  Only report errors" << std::endl;
    std::cout << "  --info <path>            Describe a GIF and exit" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << " --config example_config.yaml" << std::endl;
    std::cout << "  " << program_name << " --config config.yaml --profile aggressive" << std::endl;
    std::cout << "  " << program_name << " --input in.gif --output out.gif --percent 40" << std::endl;
    std::cout << std::endl;
}

bool parse_stage_list(const std::string& text, std::vector<gifpress::Stage>& stages)
{
    std::vector<gifpress::Stage> parsed;
    std::string current;
    int depth = 0;

    // Commas inside parentheses belong to the argument
    for (size_t i = 0; i <= text.size(); ++i) {
        const char c = i < text.size() ? text[i] : ',';
        if (c == '(') {
            ++depth;
        }
        else if (c == ')') {
            --depth;
        }
        if (c == ',' && depth <= 0) {
            if (current.find_first_not_of(" \t") != std::string::npos) {
                gifpress::Stage stage;
                std::string error;
                if (!gifpress::parse_stage(current, stage, error)) {
                    std::cerr << "Error: " << error << std::endl;
                    return false;
                }
                parsed.push_back(stage);
            }
            current.clear();
            depth = 0;
        }
        else {
            current += c;
        }
    }

    stages = parsed;
    return true;
}

// First pass: only the options that select the configuration file
bool find_config_arguments(int argc, char** argv, std::string& config_file, std::string& profile)
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--profile") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return false;
            }
            (arg == "--config" ? config_file : profile) = argv[++i];
        }
    }
    return true;
}

// Second pass: every other option, overriding values loaded from the file
bool parse_command_line(int argc, char** argv, gifpress::CompressionConfig& config, std::string& info_path)
{
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string v;

        try {
            if (arg == "--help" || arg == "-h") {
                return false;
            }
            else if (arg == "--config" || arg == "--profile") {
                ++i;
            }
            else if (arg == "--info") {
                if (!value(info_path)) return false;
            }
            else if (arg == "--input") {
                if (!value(config.input)) return false;
            }
            else if (arg == "--frames-dir") {
                if (!value(config.frames_dir)) return false;
            }
            else if (arg == "--delay") {
                if (!value(v)) return false;
                config.frame_delay = static_cast<uint32_t>(std::stoul(v));
            }
            else if (arg == "--output") {
                if (!value(config.output)) return false;
            }
            else if (arg == "--percent") {
                if (!value(v)) return false;
                config.target_percent = static_cast<uint32_t>(std::stoul(v));
            }
            else if (arg == "--stages") {
                if (!value(v)) return false;
                if (!parse_stage_list(v, config.stages)) return false;
            }
            else if (arg == "--seed") {
                if (!value(v)) return false;
                config.quantize_seed = static_cast<uint32_t>(std::stoul(v));
            }
            else if (arg == "--threads") {
                if (!value(v)) return false;
                config.worker_threads = static_cast<uint32_t>(std::stoul(v));
            }
            else if (arg == "--time-budget-ms") {
                if (!value(v)) return false;
                config.time_budget_ms = std::stoull(v);
            }
            else if (arg == "--loop-count") {
                if (!value(v)) return false;
                config.loop_count = std::stoll(v);
            }
            else if (arg == "--stats") {
                config.write_stats = true;
            }
            else if (arg == "--dump-frames") {
                if (!value(config.dump_frames_dir)) return false;
            }
            else if (arg == "--quiet") {
                config.verbose = false;
            }
            else {
                std::cerr << "Error: Unknown argument: " << arg << std::endl;
                return false;
            }
        }
        catch (const std::exception&) {
            std::cerr << "Error: invalid value for " << arg << std::endl;
            return false;
        }
    }

    return true;
}

int print_info(const std::string& path)
{
    std::vector<uint8_t> bytes;
    std::string error;
    if (!gifpress::read_file_bytes(path, bytes, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    gifpress::GifCodec codec;
    gifpress::Animation animation;
    if (!codec.decode(bytes.data(), bytes.size(), animation)) {
        std::cerr << "Error: " << codec.last_error() << std::endl;
        return 1;
    }

    std::cout << path << std::endl;
    std::cout << "  Size: " << bytes.size() << " bytes" << std::endl;
    std::cout << "  Canvas: " << animation.width << "x" << animation.height << std::endl;
    std::cout << "  Frames: " << animation.frame_count() << std::endl;
    std::cout << "  Duration: " << animation.total_duration() * 10 << " ms" << std::endl;
    std::cout << "  Loop count: " << animation.loop_count
              << (animation.loop_count == 0 ? " (infinite)" : "") << std::endl;
    std::cout << "  Transparency: " << (animation.uses_transparency() ? "yes" : "no") << std::endl;
    if (animation.has_palette) {
        std::cout << "  Global palette: " << animation.palette.size() << " entries" << std::endl;
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    gifpress::CompressionConfig config;
    std::string config_file;
    std::string profile;
    std::string info_path;

    if (!find_config_arguments(argc, argv, config_file, profile)) {
        print_usage(argv[0]);
        return 1;
    }

    // Load configuration
    if (!config_file.empty()) {
        std::cout << "Loading configuration from: " << config_file << std::endl;
        if (!profile.empty()) {
            std::cout << "Using profile: " << profile << std::endl;
        }

        if (!config.load_from_yaml(config_file, profile)) {
            std::cerr << "Failed to load configuration" << std::endl;
            return 1;
        }
    }

    if (!parse_command_line(argc, argv, config, info_path)) {
        print_usage(argv[0]);
        return 1;
    }

    if (!info_path.empty()) {
        return print_info(info_path);
    }

    // Validate configuration
    if (!config.validate()) {
        std::cerr << "Invalid configuration" << std::endl;
        return 1;
    }

    if (config.verbose) {
        std::cout << std::endl;
        config.print();
        std::cout << std::endl;
    }

    gifpress::set_worker_threads(config.worker_threads);
    if (config.verbose) {
        std::cout << "Using " << gifpress::worker_threads() << " worker thread(s)" << std::endl;
    }

    // Load input
    gifpress::GifCodec codec;
    codec.set_alpha_cutoff(static_cast<uint8_t>(config.alpha_cutoff));
    codec.set_quantize_seed(config.quantize_seed);

    gifpress::Animation animation;
    std::string error;
    size_t input_bytes = 0;

    if (!config.input.empty()) {
        std::vector<uint8_t> bytes;
        if (!gifpress::read_file_bytes(config.input, bytes, error)) {
            std::cerr << "Error: " << error << std::endl;
            return 1;
        }
        input_bytes = bytes.size();
        if (!codec.decode(bytes.data(), bytes.size(), animation)) {
            std::cerr << "Failed to decode " << config.input << ": " << codec.last_error() << std::endl;
            return 1;
        }
    }
    else if (!gifpress::load_png_sequence(config.frames_dir, config.frame_delay, animation, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    if (config.loop_count >= 0) {
        animation.loop_count = static_cast<uint32_t>(config.loop_count);
    }

    if (config.verbose) {
        std::cout << "Loaded " << animation.frame_count() << " frames ("
                  << animation.width << "x" << animation.height << ")";
        if (input_bytes > 0) {
            std::cout << ", " << input_bytes << " bytes on disk";
        }
        std::cout << std::endl << std::endl;
    }

    // Cancellation: interrupt signal or wall-clock budget, checked between stages
    const auto start = std::chrono::steady_clock::now();
    const uint64_t budget_ms = config.time_budget_ms;

    gifpress::PipelineOptions options;
    options.stages = config.stages;
    options.context = config.stage_context();
    options.verbose = config.verbose;
    options.cancel_requested = [start, budget_ms]() {
        if (g_interrupted) {
            return true;
        }
        if (budget_ms == 0) {
            return false;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        return static_cast<uint64_t>(elapsed) >= budget_ms;
    };

    gifpress::CompressionPipeline pipeline(codec, options);
    gifpress::CompressionResult result;
    gifpress::CompressionError compression_error;

    try {
        if (!pipeline.compress(std::move(animation), config.target_percent, result, compression_error)) {
            std::cerr << "Compression failed: " << compression_error.to_string() << std::endl;
            return 2;
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Exception during compression: " << e.what() << std::endl;
        return 2;
    }

    if (!gifpress::write_file_bytes(config.output, result.encoded, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    if (config.verbose) {
        pipeline.print_summary(result);
        std::cout << "Wrote " << config.output << std::endl;
    }

    if (config.write_stats) {
        if (!pipeline.write_statistics(result, config.output + ".stats.json", config.output + ".stages.csv")) {
            return 1;
        }
    }

    if (!config.dump_frames_dir.empty()) {
        if (!gifpress::write_png_sequence(config.dump_frames_dir, result.animation, error)) {
            std::cerr << "Error: " << error << std::endl;
            return 1;
        }
    }

    if (g_interrupted) {
        std::cout << "Compression interrupted by user" << std::endl;
        return 130; // Standard exit code for SIGINT
    }

    if (config.verbose) {
        std::cout << std::endl;
        std::cout << "Compression completed successfully!" << std::endl;
    }

    return 0;
}
