/**
 * @file pipeline.cpp
 * @brief Adaptive compression pipeline orchestration
 *
 * Runs the stage list in order, probing the encoded size after each stage
 * and stopping at the first one that reaches the target size.
 */

#include "pipeline.hpp"
#include "dedup.hpp"
#include "size_probe.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace gifpress {

const char* pipeline_state_name(PipelineState state)
{
    switch (state) {
        case PipelineState::PENDING: return "Pending";
        case PipelineState::CONVERGED: return "Converged";
        case PipelineState::EXHAUSTED: return "Exhausted";
        case PipelineState::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

std::string CompressionResult::to_json() const
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << "{\n";
    oss << "  \"state\": \"" << pipeline_state_name(state) << "\",\n";
    oss << "  \"initial_size\": " << initial_size << ",\n";
    oss << "  \"target_size\": " << target_size << ",\n";
    oss << "  \"final_size\": " << final_size << ",\n";
    oss << "  \"achieved_percent\": " << achieved_percent << ",\n";
    oss << "  \"frames\": " << animation.frame_count() << ",\n";
    oss << "  \"palette_size\": " << (animation.has_palette ? animation.palette.size() : 0) << ",\n";
    oss << "  \"probe_count\": " << probe_count << ",\n";
    oss << "  \"total_probe_ms\": " << total_probe_ms << ",\n";
    oss << "  \"stages_applied\": [";
    for (size_t i = 0; i < stages_applied.size(); ++i) {
        oss << (i ? ", " : "") << "\"" << json_escape(stages_applied[i]) << "\"";
    }
    oss << "]\n";
    oss << "}";

    return oss.str();
}

CompressionPipeline::CompressionPipeline(AnimationEncoder& encoder, const PipelineOptions& options)
    : encoder_(encoder)
    , options_(options)
{
}

bool CompressionPipeline::compress(
    Animation input,
    uint32_t target_percent,
    CompressionResult& result,
    CompressionError& error)
{
    error.clear();

    if (target_percent < 1 || target_percent > 99) {
        std::ostringstream oss;
        oss << "target percent " << target_percent << " outside [1, 99]";
        return error.set(ErrorKind::INVALID_TARGET, oss.str());
    }

    if (input.frames.empty()) {
        return error.set(ErrorKind::EMPTY_ANIMATION, "animation has no frames");
    }

    for (size_t i = 0; i < options_.stages.size(); ++i) {
        std::string problem;
        if (!options_.stages[i].validate(problem)) {
            std::ostringstream oss;
            oss << "stage " << i << ": " << problem;
            return error.set(ErrorKind::INVALID_PARAMETER, oss.str());
        }
    }

    SizeProbe probe(encoder_);

    size_t initial_size = 0;
    if (!probe.measure(input, initial_size, error)) {
        return false;
    }
    if (initial_size == 0) {
        return error.set(ErrorKind::ENCODE_PROBE_FAILURE, "encoder produced no bytes for the input animation");
    }

    const uint64_t target_size = static_cast<uint64_t>(initial_size) * target_percent / 100;

    if (options_.verbose) {
        std::cout << "=== Compression Pipeline ===" << std::endl;
        std::cout << "Frames: " << input.frame_count()
                  << " | Canvas: " << input.width << "x" << input.height << std::endl;
        std::cout << "Initial size: " << initial_size << " bytes" << std::endl;
        std::cout << "Target: " << target_percent << "% (" << target_size << " bytes)" << std::endl;
        std::cout << "Stages: " << options_.stages.size() << std::endl;
        std::cout << std::endl;
    }

    CompressionResult out;
    out.initial_size = initial_size;
    out.target_size = target_size;

    Animation current = std::move(input);
    uint64_t current_size = initial_size;
    PipelineState state = PipelineState::PENDING;

    for (size_t i = 0; i < options_.stages.size() && state == PipelineState::PENDING; ++i) {
        if (options_.cancel_requested && options_.cancel_requested()) {
            state = PipelineState::CANCELLED;
            if (options_.verbose) {
                std::cout << "Cancelled before stage " << i << std::endl;
            }
            break;
        }

        const Stage& stage = options_.stages[i];

        StageStats stats;
        stats.stage_index = static_cast<uint32_t>(i);
        stats.descriptor = stage.describe();
        stats.frames_before = static_cast<uint32_t>(current.frame_count());

        const auto apply_start = std::chrono::high_resolution_clock::now();

        Animation next;
        if (!apply_stage(stage, current, options_.context, next, error)) {
            error.message = stats.descriptor + ": " + error.message;
            return false;
        }

        const auto apply_end = std::chrono::high_resolution_clock::now();
        stats.apply_ms = std::chrono::duration<double, std::milli>(apply_end - apply_start).count();

        size_t size = 0;
        if (!probe.measure(next, size, error)) {
            return false;
        }

        stats.probe_ms = probe.last_probe_ms();
        stats.frames_after = static_cast<uint32_t>(next.frame_count());
        stats.palette_size = next.has_palette ? static_cast<uint32_t>(next.palette.size()) : 0;
        stats.size_bytes = size;
        stats.percent_of_initial = 100.0 * static_cast<double>(size) / static_cast<double>(initial_size);

        if (stats.frames_before == stats.frames_after) {
            const ErrorStats err = compute_error_stats(current.frames, next.frames);
            stats.mean_error = err.mean_error;
            stats.rmse = err.rmse;
        }

        current = std::move(next);
        current_size = size;
        out.stages_applied.push_back(stats.descriptor);

        if (options_.verbose) {
            std::cout << "Stage " << std::setw(2) << i
                      << " " << std::left << std::setw(18) << stats.descriptor << std::right
                      << " | " << std::setw(9) << size << " bytes"
                      << " | " << std::fixed << std::setprecision(2) << stats.percent_of_initial << "%"
                      << " | " << stats.frames_after << " frames"
                      << " | " << std::setprecision(1) << stats.apply_ms << " ms"
                      << std::endl;
        }

        out.stage_stats.push_back(stats);

        if (current_size <= target_size) {
            state = PipelineState::CONVERGED;
        }
    }

    if (state == PipelineState::PENDING) {
        state = PipelineState::EXHAUSTED;
    }

    out.state = state;
    out.final_size = current_size;
    out.achieved_percent = 100.0 * static_cast<double>(current_size) / static_cast<double>(initial_size);
    out.encoded = probe.take_last_bytes();
    out.animation = std::move(current);
    out.probe_count = probe.probe_count();
    out.total_probe_ms = probe.total_probe_ms();

    result = std::move(out);
    return true;
}

void CompressionPipeline::print_summary(const CompressionResult& result) const
{
    std::cout << std::endl;
    std::cout << "=== Compression Summary ===" << std::endl;
    std::cout << "State: " << pipeline_state_name(result.state) << std::endl;
    std::cout << "Stages applied: " << result.stages_applied.size() << std::endl;
    for (const auto& s : result.stages_applied) {
        std::cout << "  " << s << std::endl;
    }
    std::cout << "Initial size: " << result.initial_size << " bytes" << std::endl;
    std::cout << "Final size: " << result.final_size << " bytes" << std::endl;
    std::cout << "Target size: " << result.target_size << " bytes" << std::endl;
    std::cout << "Achieved: " << std::fixed << std::setprecision(2) << result.achieved_percent << "%" << std::endl;
    std::cout << "Frames: " << result.animation.frame_count() << std::endl;
    std::cout << "Size probes: " << result.probe_count
              << " (" << std::setprecision(1) << result.total_probe_ms << " ms)" << std::endl;
}

bool CompressionPipeline::write_statistics(
    const CompressionResult& result,
    const std::string& json_path,
    const std::string& csv_path) const
{
    std::ofstream ofs(json_path);
    if (!ofs) {
        std::cerr << "Failed to write statistics to " << json_path << std::endl;
        return false;
    }
    ofs << result.to_json() << "\n";
    if (!ofs) {
        std::cerr << "Failed to write statistics to " << json_path << std::endl;
        return false;
    }

    return write_stage_csv(csv_path, result.stage_stats);
}

} // namespace gifpress
