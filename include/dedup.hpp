#pragma once

#include <cstdint>
#include <vector>
#include "frame.hpp"
#include "error.hpp"

namespace gifpress {

/**
 * @file dedup.hpp
 * @brief Merging of near-identical consecutive frames
 *
 * Static stretches of an animation are often stored as many frames that
 * differ only by noise. Collapsing them into one frame with the combined
 * delay removes whole images from the encoded stream without changing
 * playback timing.
 */

/// Difference reported for frames that cannot be compared pixel-for-pixel
constexpr double FRAME_DIFF_INCOMPARABLE = 256.0;

/**
 * Mean absolute per-channel difference between two frames
 * Formula: sum(|a_c - b_c|) / (pixels * 4) over R, G, B and A
 *
 * @return Value in [0, 255], or FRAME_DIFF_INCOMPARABLE if sizes differ
 */
double frame_difference(const Frame& a, const Frame& b);

/**
 * Merge consecutive frames whose difference to the current representative
 * is at most `threshold`. The representative keeps its pixels and absorbs
 * the merged frame's delay. Frames with differing transparency flags are
 * never merged.
 *
 * @param frames Input frames (not modified)
 * @param threshold Maximum difference on the 0-255 scale
 * @param output Deduplicated frames (output)
 * @param error Failure description (output)
 * @return false with DELAY_OVERFLOW if a merged delay would exceed
 *         MAX_FRAME_DELAY, or INVALID_PARAMETER if threshold > 255
 */
bool dedupe_frames(
    const std::vector<Frame>& frames,
    uint32_t threshold,
    std::vector<Frame>& output,
    CompressionError& error
);

/**
 * Reconstruction error between an original and a processed frame
 */
struct ErrorStats {
    double max_error;
    double mean_error;
    double rmse;

    ErrorStats() : max_error(0.0), mean_error(0.0), rmse(0.0) {}
};

/**
 * Per-channel error statistics over RGB (alpha excluded)
 * Frames must share dimensions; otherwise zeroed stats are returned.
 */
ErrorStats compute_error_stats(const Frame& original, const Frame& processed);

/**
 * Average error statistics over two equally long frame sequences
 */
ErrorStats compute_error_stats(const std::vector<Frame>& original, const std::vector<Frame>& processed);

} // namespace gifpress
