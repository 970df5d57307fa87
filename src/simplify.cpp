/**
 * @file simplify.cpp
 * @brief Lossy channel rounding implementation
 */

#include "simplify.hpp"
#include "parallel.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace gifpress {

uint32_t quality_to_step(uint32_t quality)
{
    if (quality >= 100) {
        return 1;
    }
    const uint32_t loss = 100 - quality;
    return 1 + (loss * loss) / 128;
}

RoundingTable build_rounding_table(uint32_t step)
{
    RoundingTable table;
    if (step <= 1) {
        return table;
    }

    table.step = step;
    const uint32_t half = step / 2;

    for (uint32_t v = 0; v < 256; ++v) {
        // round(v / step) * step with round-half-up, then clamp
        const uint32_t rounded = ((v + half) / step) * step;
        table.values[v] = static_cast<uint8_t>(std::min<uint32_t>(rounded, 255));
    }

    return table;
}

bool simplify_frames(
    const std::vector<Frame>& frames,
    uint32_t quality,
    std::vector<Frame>& output,
    CompressionError& error)
{
    if (quality > 100) {
        std::ostringstream oss;
        oss << "simplify quality " << quality << " outside [0, 100]";
        return error.set(ErrorKind::INVALID_PARAMETER, oss.str());
    }

    std::vector<Frame> result(frames);
    const RoundingTable table = build_rounding_table(quality_to_step(quality));

    if (table.is_identity()) {
        output = std::move(result);
        return true;
    }

    const long frame_count = static_cast<long>(result.size());

    GIFPRESS_PARALLEL_FOR
    for (long f = 0; f < frame_count; ++f) {
        Frame& frame = result[static_cast<size_t>(f)];
        const size_t pixel_count = frame.pixel_count();
        uint8_t* p = frame.data.data();

        for (size_t i = 0; i < pixel_count; ++i, p += 4) {
            p[0] = table.apply(p[0]);
            p[1] = table.apply(p[1]);
            p[2] = table.apply(p[2]);
        }
    }

    output = std::move(result);
    return true;
}

Palette simplify_palette(const Palette& palette, const RoundingTable& table)
{
    Palette out;
    out.has_transparent = palette.has_transparent;

    for (const Rgb& c : palette.colors) {
        const Rgb rounded(table.apply(c.r), table.apply(c.g), table.apply(c.b));
        if (!out.contains(rounded)) {
            out.colors.push_back(rounded);
        }
    }

    return out;
}

} // namespace gifpress
