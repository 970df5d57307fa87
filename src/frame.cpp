#include "frame.hpp"
#include <sstream>
#include <utility>

namespace gifpress {

uint32_t Palette::nearest(const Rgb& c) const
{
    uint32_t best = 0;
    uint32_t best_dist = UINT32_MAX;

    for (size_t i = 0; i < colors.size(); ++i) {
        const uint32_t dist = rgb_distance_sq(c, colors[i]);
        // Strict less-than keeps the lowest index on ties
        if (dist < best_dist) {
            best_dist = dist;
            best = static_cast<uint32_t>(i);
            if (dist == 0) {
                break;
            }
        }
    }

    return best;
}

bool Palette::contains(const Rgb& c) const
{
    for (const Rgb& entry : colors) {
        if (entry == c) {
            return true;
        }
    }
    return false;
}

void Frame::fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    const size_t count = pixel_count();
    for (size_t i = 0; i < count; ++i) {
        uint8_t* p = pixel(i);
        p[0] = r;
        p[1] = g;
        p[2] = b;
        p[3] = a;
    }
}

uint64_t Animation::total_duration() const
{
    uint64_t total = 0;
    for (const Frame& f : frames) {
        total += f.delay;
    }
    return total;
}

bool Animation::uses_transparency() const
{
    for (const Frame& f : frames) {
        if (f.transparent) {
            return true;
        }
    }
    return false;
}

void Animation::add_frame(Frame frame)
{
    if (frames.empty() && width == 0 && height == 0) {
        width = frame.width;
        height = frame.height;
    }
    frames.push_back(std::move(frame));
}

bool Animation::validate(std::string& error) const
{
    if (width == 0 || height == 0) {
        error = "animation canvas has zero size";
        return false;
    }

    if (has_palette && palette.size() > MAX_PALETTE_SIZE) {
        error = "shared palette exceeds 256 entries";
        return false;
    }

    for (size_t i = 0; i < frames.size(); ++i) {
        const Frame& f = frames[i];
        std::ostringstream oss;

        if (!f.is_valid()) {
            oss << "frame " << i << " is malformed ("
                << f.width << "x" << f.height << ", " << f.data.size()
                << " bytes, delay " << f.delay << ")";
            error = oss.str();
            return false;
        }

        if (f.width > width || f.height > height) {
            oss << "frame " << i << " (" << f.width << "x" << f.height
                << ") exceeds canvas " << width << "x" << height;
            error = oss.str();
            return false;
        }
    }

    return true;
}

} // namespace gifpress
