#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include "frame.hpp"
#include "error.hpp"

namespace gifpress {

/**
 * Number of frames kept when retaining `fraction` of `frame_count`
 * Always at least 2 (first and last) once there are more than 2 frames.
 */
size_t subsample_keep_count(size_t frame_count, double fraction);

/**
 * Evenly spaced indices including 0 and frame_count - 1
 * index_i = round(i * (frame_count - 1) / (keep - 1))
 */
std::vector<size_t> subsample_indices(size_t frame_count, size_t keep);

/**
 * Drop frames uniformly, keeping about `fraction` of them
 *
 * Each dropped frame's delay goes to the nearest retained frame (by index,
 * ties to the earlier one), so total duration is unchanged.
 *
 * @param frames Input frames (not modified)
 * @param fraction Share of frames to keep, (0, 1]
 * @param output Retained frames (output)
 * @param error Failure description (output)
 * @return false with INVALID_PARAMETER for a bad fraction, or DELAY_OVERFLOW
 *         if a retained frame's delay would exceed MAX_FRAME_DELAY
 */
bool drop_frames(
    const std::vector<Frame>& frames,
    double fraction,
    std::vector<Frame>& output,
    CompressionError& error
);

} // namespace gifpress
