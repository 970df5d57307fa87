#pragma once

#include <cstdint>
#include <vector>
#include "frame.hpp"
#include "error.hpp"

namespace gifpress {

/**
 * @file quantize.hpp
 * @brief Palette construction and pixel remapping
 *
 * Builds one palette for the whole animation with weighted k-means over the
 * color histogram of every frame, then maps each pixel to its nearest
 * palette entry.
 */

/// Histograms with more distinct colors are merged into 15-bit buckets before clustering
constexpr size_t MAX_CLUSTER_SAMPLES = 32768;

/**
 * Quantizer parameters
 */
struct QuantizerParams {
    uint32_t max_colors;      ///< Palette bound, [2, 256]
    uint32_t seed;            ///< k-means++ seed
    uint8_t alpha_cutoff;     ///< Pixels below this alpha are transparent
    uint32_t max_iterations;  ///< Lloyd iteration cap

    QuantizerParams(uint32_t colors = 256, uint32_t s = 1, uint8_t cutoff = 128, uint32_t iterations = 16)
        : max_colors(colors), seed(s), alpha_cutoff(cutoff), max_iterations(iterations) {}
};

/**
 * One histogram entry
 */
struct ColorSample {
    Rgb color;
    uint64_t weight;

    ColorSample() : weight(0) {}
    ColorSample(const Rgb& c, uint64_t w) : color(c), weight(w) {}
};

/**
 * Count distinct colors over all frames
 * @param frames Source frames
 * @param skip_transparent Exclude pixels with alpha below alpha_cutoff
 * @param alpha_cutoff Alpha threshold
 * @return Samples sorted by packed color key
 */
std::vector<ColorSample> collect_color_histogram(
    const std::vector<Frame>& frames,
    bool skip_transparent,
    uint8_t alpha_cutoff
);

/**
 * Merge a histogram into 5-bit-per-channel buckets, each represented by the
 * weighted mean of its members
 */
std::vector<ColorSample> bucket_color_histogram(const std::vector<ColorSample>& samples);

/**
 * Weighted k-means over color samples
 *
 * Seeding is k-means++ driven by std::mt19937(seed); the result depends
 * only on the inputs. Centroids are rounded to 8 bits and deduplicated, so
 * fewer than k colors may be returned.
 *
 * @param samples Weighted colors (at least one)
 * @param k Number of clusters
 * @param seed Seed for k-means++ initialization
 * @param max_iterations Lloyd iteration cap
 * @return Palette colors sorted by packed key
 */
std::vector<Rgb> cluster_colors(
    const std::vector<ColorSample>& samples,
    uint32_t k,
    uint32_t seed,
    uint32_t max_iterations
);

/**
 * Build a palette for all frames and remap every pixel to it
 *
 * When `use_transparency` is set, pixels with alpha below the cutoff are
 * excluded from sampling and written as (0, 0, 0, 0); one palette slot is
 * reserved for them. Otherwise every pixel is sampled and keeps its alpha.
 *
 * @param frames Input frames (not modified)
 * @param params Quantizer parameters
 * @param use_transparency Whether the source animation uses transparency
 * @param output Remapped frames (output)
 * @param palette Palette every opaque output pixel belongs to (output)
 * @param error Failure description (output)
 * @return false with INVALID_PARAMETER if max_colors is outside [2, 256]
 */
bool quantize_frames(
    const std::vector<Frame>& frames,
    const QuantizerParams& params,
    bool use_transparency,
    std::vector<Frame>& output,
    Palette& palette,
    CompressionError& error
);

} // namespace gifpress
