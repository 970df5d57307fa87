#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include "frame.hpp"
#include "error.hpp"

namespace gifpress {

/**
 * @file simplify.hpp
 * @brief Lossy channel rounding
 *
 * LZW in GIF pays for every change in the index stream. Snapping channel
 * values to a coarser grid turns gradients and dither noise into flat runs
 * that the encoder can describe with far fewer codes.
 *
 * Step size as a function of quality:
 *   step(q) = 1 + (100 - q)^2 / 128   (integer division)
 *
 *   quality  100  80  60  40   0
 *   step       1   4  13  29  79
 *
 * The curve is monotonic and flat near q = 100, so light settings barely
 * touch the image while low settings band hard.
 */

/**
 * Channel rounding lookup table for one quality setting
 */
struct RoundingTable {
    uint32_t step;
    uint8_t values[256];

    RoundingTable() : step(1) {
        for (uint32_t i = 0; i < 256; ++i) {
            values[i] = static_cast<uint8_t>(i);
        }
    }

    /// Identity tables leave pixel data unchanged
    bool is_identity() const { return step <= 1; }

    uint8_t apply(uint8_t v) const { return values[v]; }
};

/**
 * Map quality [0, 100] to a rounding step (quality 100 => step 1)
 */
uint32_t quality_to_step(uint32_t quality);

/**
 * Build the rounding table for a step
 * Each entry: clamp(round(v / step) * step, 0, 255), rounding half up
 */
RoundingTable build_rounding_table(uint32_t step);

/**
 * Round R, G and B of every pixel; alpha is left untouched.
 * Frames are processed in parallel; the table is shared read-only.
 *
 * @param frames Input frames (not modified)
 * @param quality Quality in [0, 100]
 * @param output Simplified frames (output)
 * @param error Failure description (output)
 * @return false with INVALID_PARAMETER if quality > 100
 */
bool simplify_frames(
    const std::vector<Frame>& frames,
    uint32_t quality,
    std::vector<Frame>& output,
    CompressionError& error
);

/**
 * Pass a palette through a rounding table, dropping entries that collapse
 * onto an earlier one
 */
Palette simplify_palette(const Palette& palette, const RoundingTable& table);

} // namespace gifpress
