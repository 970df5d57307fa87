#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>

namespace gifpress {

/**
 * Per-stage statistics recorded by the pipeline
 */
struct StageStats {
    uint32_t stage_index;
    std::string descriptor;

    // Animation shape after the stage
    uint32_t frames_before;
    uint32_t frames_after;
    uint32_t palette_size;     // 0 when no shared palette

    // Size oracle
    uint64_t size_bytes;
    double percent_of_initial;

    // Timing
    double apply_ms;
    double probe_ms;

    // Pixel error against the stage input (only when frame count is unchanged)
    double mean_error;
    double rmse;

    StageStats()
        : stage_index(0),
          frames_before(0), frames_after(0), palette_size(0),
          size_bytes(0), percent_of_initial(0),
          apply_ms(0), probe_ms(0),
          mean_error(0), rmse(0) {}

    // Format as CSV row
    std::string to_csv() const;

    // CSV header
    static std::string csv_header();
};

/**
 * Write stage statistics as CSV (header plus one row per stage)
 * @return true on success
 */
bool write_stage_csv(const std::string& path, const std::vector<StageStats>& stages);

/**
 * Escape a string for embedding in a JSON document
 */
std::string json_escape(const std::string& s);

} // namespace gifpress
