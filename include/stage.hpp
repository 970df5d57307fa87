#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "frame.hpp"
#include "error.hpp"
#include "quantize.hpp"

namespace gifpress {

/**
 * Transform applied by one pipeline stage
 */
enum class StageKind {
    DEDUP,          // merge near-identical consecutive frames
    QUANTIZE,       // shared palette of at most N colors
    SIMPLIFY,       // round channels at a quality level
    DROP_FRAMES     // keep a fraction of the frames
};

/**
 * One parameterized stage. Only the field matching `kind` is meaningful.
 */
struct Stage {
    StageKind kind;
    uint32_t threshold;   ///< DEDUP: difference threshold, [0, 255]
    uint32_t max_colors;  ///< QUANTIZE: palette bound, [2, 256]
    uint32_t quality;     ///< SIMPLIFY: quality, [0, 100]
    double fraction;      ///< DROP_FRAMES: share kept, (0, 1]

    Stage()
        : kind(StageKind::DEDUP), threshold(0), max_colors(0), quality(0), fraction(0.0) {}

    static Stage dedup(uint32_t threshold);
    static Stage quantize(uint32_t max_colors);
    static Stage simplify(uint32_t quality);
    static Stage drop_frames(double fraction);

    /// Canonical descriptor, e.g. "Dedup(10)" or "DropFrames(0.70)"
    std::string describe() const;

    /**
     * Check the parameter range for this kind
     * @param error Description of the problem (output)
     */
    bool validate(std::string& error) const;

    bool operator==(const Stage& o) const;
};

/**
 * Settings shared by every stage of one run
 */
struct StageContext {
    uint32_t quantize_seed;
    uint8_t alpha_cutoff;
    uint32_t kmeans_iterations;

    StageContext() : quantize_seed(1), alpha_cutoff(128), kmeans_iterations(16) {}
};

/**
 * Reference stage sequence:
 * Dedup(10), Quantize(128), Simplify(80), Quantize(64), Simplify(60),
 * Quantize(32), Simplify(40), Dedup(5), Quantize(16), DropFrames(0.70)
 */
std::vector<Stage> reference_stages();

/**
 * Parse a descriptor such as "Quantize(64)" (names are case-insensitive)
 * @param text Descriptor
 * @param stage Parsed stage (output)
 * @param error Parse or range error (output)
 */
bool parse_stage(const std::string& text, Stage& stage, std::string& error);

/**
 * Apply one stage to an animation, producing a new one
 *
 * Quantize installs the shared palette; Simplify rounds it along with the
 * pixels; Dedup and DropFrames keep it.
 *
 * @param stage Stage to run
 * @param input Current animation (not modified)
 * @param context Shared settings
 * @param output Transformed animation (output)
 * @param error Failure description (output)
 */
bool apply_stage(
    const Stage& stage,
    const Animation& input,
    const StageContext& context,
    Animation& output,
    CompressionError& error
);

} // namespace gifpress
