/**
 * @file dedup.cpp
 * @brief Frame difference metric and consecutive-frame merging
 */

#include "dedup.hpp"
#include <cmath>
#include <cstdlib>
#include <algorithm>
#include <sstream>
#include <utility>

namespace gifpress {

double frame_difference(const Frame& a, const Frame& b)
{
    if (a.width != b.width || a.height != b.height || a.data.size() != b.data.size()) {
        return FRAME_DIFF_INCOMPARABLE;
    }

    const size_t count = a.data.size();
    if (count == 0) {
        return 0.0;
    }

    const uint8_t* pa = a.data.data();
    const uint8_t* pb = b.data.data();

    uint64_t total = 0;
    for (size_t i = 0; i < count; ++i) {
        total += static_cast<uint64_t>(std::abs(static_cast<int32_t>(pa[i]) - static_cast<int32_t>(pb[i])));
    }

    return static_cast<double>(total) / static_cast<double>(count);
}

bool dedupe_frames(
    const std::vector<Frame>& frames,
    uint32_t threshold,
    std::vector<Frame>& output,
    CompressionError& error)
{
    if (threshold > 255) {
        std::ostringstream oss;
        oss << "dedup threshold " << threshold << " outside [0, 255]";
        return error.set(ErrorKind::INVALID_PARAMETER, oss.str());
    }

    std::vector<Frame> result;
    if (frames.empty()) {
        output = std::move(result);
        return true;
    }

    result.reserve(frames.size());
    result.push_back(frames[0]);

    // Index in `frames` of the current representative; comparisons use the
    // original pixels, which the emitted copy shares
    size_t rep_index = 0;

    for (size_t i = 1; i < frames.size(); ++i) {
        const Frame& representative = frames[rep_index];
        const Frame& current = frames[i];

        bool merge = false;
        if (current.transparent == representative.transparent) {
            merge = frame_difference(representative, current) <= static_cast<double>(threshold);
        }

        if (merge) {
            Frame& emitted = result.back();
            const uint64_t combined = static_cast<uint64_t>(emitted.delay) + current.delay;
            if (combined > MAX_FRAME_DELAY) {
                std::ostringstream oss;
                oss << "merging frame " << i << " into frame " << rep_index
                    << " needs delay " << combined << " (max " << MAX_FRAME_DELAY
                    << "); split the run before deduplicating";
                return error.set(ErrorKind::DELAY_OVERFLOW, oss.str());
            }
            emitted.delay = static_cast<uint32_t>(combined);
        }
        else {
            result.push_back(current);
            rep_index = i;
        }
    }

    output = std::move(result);
    return true;
}

ErrorStats compute_error_stats(const Frame& original, const Frame& processed)
{
    ErrorStats stats;

    if (original.width != processed.width || original.height != processed.height
        || original.data.size() != processed.data.size()) {
        return stats;
    }

    const size_t pixel_count = original.pixel_count();
    if (pixel_count == 0) {
        return stats;
    }

    double sum_error = 0.0;
    double sum_sq_error = 0.0;
    double max_err = 0.0;

    for (size_t i = 0; i < pixel_count; ++i) {
        const uint8_t* po = original.pixel(i);
        const uint8_t* pp = processed.pixel(i);
        for (int c = 0; c < 3; ++c) {
            const double err = std::abs(static_cast<double>(po[c]) - static_cast<double>(pp[c]));
            sum_error += err;
            sum_sq_error += err * err;
            max_err = std::max(max_err, err);
        }
    }

    const double samples = static_cast<double>(pixel_count) * 3.0;
    stats.mean_error = sum_error / samples;
    stats.rmse = std::sqrt(sum_sq_error / samples);
    stats.max_error = max_err;

    return stats;
}

ErrorStats compute_error_stats(const std::vector<Frame>& original, const std::vector<Frame>& processed)
{
    ErrorStats total;

    if (original.empty() || original.size() != processed.size()) {
        return total;
    }

    for (size_t i = 0; i < original.size(); ++i) {
        const ErrorStats s = compute_error_stats(original[i], processed[i]);
        total.mean_error += s.mean_error;
        total.rmse += s.rmse;
        total.max_error = std::max(total.max_error, s.max_error);
    }

    total.mean_error /= original.size();
    total.rmse /= original.size();

    return total;
}

} // namespace gifpress
