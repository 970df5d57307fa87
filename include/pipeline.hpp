#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "encoder.hpp"
#include "error.hpp"
#include "frame.hpp"
#include "stage.hpp"
#include "stats.hpp"

namespace gifpress {

/**
 * Pipeline state machine. PENDING is the only non-terminal state.
 */
enum class PipelineState {
    PENDING,
    CONVERGED,      // measured size reached the target
    EXHAUSTED,      // every stage ran without reaching the target
    CANCELLED       // cancel check fired between stages
};

const char* pipeline_state_name(PipelineState state);

/**
 * Options for one CompressionPipeline
 */
struct PipelineOptions {
    std::vector<Stage> stages;
    StageContext context;
    bool verbose;

    /// Evaluated before each stage; returning true stops the run
    std::function<bool()> cancel_requested;

    PipelineOptions() : stages(reference_stages()), verbose(false) {}
};

/**
 * Outcome of a successful compress() call
 */
struct CompressionResult {
    Animation animation;                    // last measured animation
    double achieved_percent;                // final size / initial size * 100
    std::vector<std::string> stages_applied;
    PipelineState state;

    uint64_t initial_size;
    uint64_t final_size;
    uint64_t target_size;

    std::vector<uint8_t> encoded;           // bytes of the final measurement
    std::vector<StageStats> stage_stats;

    uint32_t probe_count;
    double total_probe_ms;

    CompressionResult()
        : achieved_percent(0.0), state(PipelineState::PENDING),
          initial_size(0), final_size(0), target_size(0),
          probe_count(0), total_probe_ms(0.0) {}

    // Export summary to JSON string
    std::string to_json() const;
};

/**
 * @brief Adaptive compression orchestrator
 *
 * Applies the configured stages in order, measuring the encoded size after
 * each one, and stops as soon as the size is within the target:
 * - Validate target, frames and every stage before any measurement
 * - Measure the input to fix the target size
 * - PENDING(i) -> apply stage i -> measure -> CONVERGED or PENDING(i+1)
 * - EXHAUSTED after the last stage, CANCELLED when the cancel check fires
 */
class CompressionPipeline {
public:
    /**
     * @brief Construct pipeline around a size oracle
     * @param encoder Encoder used for every measurement (must outlive the pipeline)
     * @param options Stage list and shared settings
     */
    explicit CompressionPipeline(AnimationEncoder& encoder, const PipelineOptions& options = PipelineOptions());

    /**
     * @brief Compress an animation towards a percentage of its encoded size
     * @param input Animation to compress (consumed)
     * @param target_percent Target size in percent of the input, [1, 99]
     * @param result Final animation and statistics (output)
     * @param error Failure description (output)
     * @return true if a result was produced, false on any error
     */
    bool compress(Animation input, uint32_t target_percent, CompressionResult& result, CompressionError& error);

    /**
     * @brief Print compression summary to stdout
     */
    void print_summary(const CompressionResult& result) const;

    /**
     * @brief Write JSON summary and per-stage CSV next to each other
     * @param json_path Path to output JSON file
     * @param csv_path Path to output CSV file
     */
    bool write_statistics(const CompressionResult& result, const std::string& json_path,
                          const std::string& csv_path) const;

    const PipelineOptions& options() const { return options_; }

private:
    AnimationEncoder& encoder_;
    PipelineOptions options_;
};

} // namespace gifpress
