/**
 * @file config.cpp
 * @brief Configuration file parsing and management
 *
 * Handles YAML configuration loading with support for multiple profiles
 * and parameter validation.
 */

#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <fstream>
#include <stdexcept>

namespace gifpress {

// Helper function to safely get YAML value with default
template<typename T>
T get_yaml_value(const YAML::Node& node, const std::string& key, const T& default_value)
{
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

bool CompressionConfig::load_from_yaml(const std::string& yaml_path, const std::string& profile_name)
{
    try {
        YAML::Node config_file = YAML::LoadFile(yaml_path);

        if (!profile_name.empty()) {
            if (!config_file["profiles"] || !config_file["profiles"][profile_name]) {
                std::cerr << "Profile not found: " << profile_name << std::endl;
                return false;
            }
            // Root keys are shared defaults, the profile overrides them
            if (!load_from_node(config_file)) {
                return false;
            }
            return load_from_node(config_file["profiles"][profile_name]);
        }

        return load_from_node(config_file);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "YAML parsing error: " << e.what() << std::endl;
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return false;
    }
}

bool CompressionConfig::load_from_node(const YAML::Node& node)
{
    try {
        input = get_yaml_value(node, "input", input);
        frames_dir = get_yaml_value(node, "frames_dir", frames_dir);
        frame_delay = get_yaml_value(node, "frame_delay", frame_delay);
        output = get_yaml_value(node, "output", output);

        target_percent = get_yaml_value(node, "target_percent", target_percent);

        if (node["stages"]) {
            if (!node["stages"].IsSequence()) {
                std::cerr << "stages must be a list of stage descriptors" << std::endl;
                return false;
            }
            std::vector<Stage> parsed;
            for (const auto& item : node["stages"]) {
                Stage stage;
                std::string error;
                if (!parse_stage(item.as<std::string>(), stage, error)) {
                    std::cerr << "Invalid stage: " << error << std::endl;
                    return false;
                }
                parsed.push_back(stage);
            }
            stages = parsed;
        }

        quantize_seed = get_yaml_value(node, "quantize_seed", quantize_seed);
        alpha_cutoff = get_yaml_value(node, "alpha_cutoff", alpha_cutoff);
        kmeans_iterations = get_yaml_value(node, "kmeans_iterations", kmeans_iterations);

        worker_threads = get_yaml_value(node, "worker_threads", worker_threads);
        time_budget_ms = get_yaml_value(node, "time_budget_ms", time_budget_ms);
        loop_count = get_yaml_value(node, "loop_count", loop_count);

        write_stats = get_yaml_value(node, "write_stats", write_stats);
        dump_frames_dir = get_yaml_value(node, "dump_frames_dir", dump_frames_dir);
        verbose = get_yaml_value(node, "verbose", verbose);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "YAML value error: " << e.what() << std::endl;
        return false;
    }

    return true;
}

bool CompressionConfig::validate() const
{
    if (input.empty() == frames_dir.empty()) {
        std::cerr << "Exactly one of input or frames_dir must be specified" << std::endl;
        return false;
    }

    if (output.empty()) {
        std::cerr << "Output path must be specified" << std::endl;
        return false;
    }

    if (target_percent < 1 || target_percent > 99) {
        std::cerr << "Target percent must be in [1, 99]" << std::endl;
        return false;
    }

    if (frame_delay < 1 || frame_delay > 65535) {
        std::cerr << "Frame delay must be in [1, 65535]" << std::endl;
        return false;
    }

    if (alpha_cutoff > 255) {
        std::cerr << "Alpha cutoff must be <= 255" << std::endl;
        return false;
    }

    if (kmeans_iterations == 0) {
        std::cerr << "K-means iterations must be > 0" << std::endl;
        return false;
    }

    if (loop_count > 65535) {
        std::cerr << "Loop count must be <= 65535" << std::endl;
        return false;
    }

    for (const auto& stage : stages) {
        std::string error;
        if (!stage.validate(error)) {
            std::cerr << "Invalid stage: " << error << std::endl;
            return false;
        }
    }

    return true;
}

StageContext CompressionConfig::stage_context() const
{
    StageContext context;
    context.quantize_seed = quantize_seed;
    context.alpha_cutoff = static_cast<uint8_t>(alpha_cutoff);
    context.kmeans_iterations = kmeans_iterations;
    return context;
}

void CompressionConfig::print() const
{
    std::cout << "Configuration:" << std::endl;
    if (!input.empty()) {
        std::cout << "  Input: " << input << std::endl;
    }
    else {
        std::cout << "  Frames: " << frames_dir << " (delay " << frame_delay << ")" << std::endl;
    }
    std::cout << "  Output: " << output << std::endl;
    std::cout << "  Target: " << target_percent << "%" << std::endl;
    std::cout << "  Stages:";
    for (const auto& stage : stages) {
        std::cout << " " << stage.describe();
    }
    std::cout << std::endl;
    std::cout << "  Quantize seed: " << quantize_seed << ", alpha cutoff: " << alpha_cutoff
              << ", k-means iterations: " << kmeans_iterations << std::endl;
    std::cout << "  Worker threads: " << (worker_threads ? std::to_string(worker_threads) : "auto") << std::endl;
    if (time_budget_ms > 0) {
        std::cout << "  Time budget: " << time_budget_ms << " ms" << std::endl;
    }
    if (loop_count >= 0) {
        std::cout << "  Loop count: " << loop_count << std::endl;
    }
}

} // namespace gifpress
