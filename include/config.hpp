#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <yaml-cpp/yaml.h>
#include "stage.hpp"

namespace gifpress {

/**
 * @brief Compression configuration structure
 *
 * Contains all parameters for one gifpress run: input source, output
 * targets, the stage list and the settings shared by the stages.
 */
struct CompressionConfig {
    // Input/output paths
    std::string input;             // input GIF
    std::string frames_dir;        // PNG frame directory (instead of input)
    uint32_t frame_delay = 10;     // delay for imported PNG frames, 10 ms units
    std::string output;            // output GIF

    // Compression target
    uint32_t target_percent = 50;
    std::vector<Stage> stages = reference_stages();

    // Stage settings
    uint32_t quantize_seed = 1;
    uint32_t alpha_cutoff = 128;
    uint32_t kmeans_iterations = 16;

    // Runtime
    uint32_t worker_threads = 0;   // 0 = all cores
    uint64_t time_budget_ms = 0;   // 0 = unlimited
    int64_t loop_count = -1;       // -1 = keep the input's loop count

    // Output options
    bool write_stats = false;      // <output>.stats.json and <output>.stages.csv
    std::string dump_frames_dir;   // export final frames as PNGs
    bool verbose = true;

    /**
     * @brief Load configuration from YAML file
     * @param yaml_path Path to YAML configuration file
     * @param profile_name Optional profile name to load
     * @return true if successful, false otherwise
     */
    bool load_from_yaml(const std::string& yaml_path, const std::string& profile_name = "");

    /**
     * @brief Load configuration from YAML node
     * @param node YAML node containing configuration
     * @return true if successful, false otherwise
     */
    bool load_from_node(const YAML::Node& node);

    /**
     * @brief Validate configuration parameters
     * @return true if valid, false otherwise
     */
    bool validate() const;

    /**
     * @brief Settings passed to every stage
     */
    StageContext stage_context() const;

    /**
     * @brief Print configuration summary to stdout
     */
    void print() const;
};

} // namespace gifpress
