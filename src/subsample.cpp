#include "subsample.hpp"
#include <cmath>
#include <algorithm>
#include <sstream>
#include <utility>

namespace gifpress {

size_t subsample_keep_count(size_t frame_count, double fraction)
{
    if (frame_count <= 2) {
        return frame_count;
    }

    const size_t keep = static_cast<size_t>(std::ceil(static_cast<double>(frame_count) * fraction));
    return std::min(frame_count, std::max<size_t>(2, keep));
}

std::vector<size_t> subsample_indices(size_t frame_count, size_t keep)
{
    std::vector<size_t> indices;
    if (frame_count == 0 || keep == 0) {
        return indices;
    }
    if (keep == 1) {
        indices.push_back(0);
        return indices;
    }

    keep = std::min(keep, frame_count);
    indices.reserve(keep);

    const uint64_t span = frame_count - 1;
    const uint64_t denom = keep - 1;
    for (uint64_t i = 0; i < keep; ++i) {
        // Integer round-half-up of i * span / denom; strictly increasing since span >= denom
        indices.push_back(static_cast<size_t>((2 * i * span + denom) / (2 * denom)));
    }

    return indices;
}

bool drop_frames(
    const std::vector<Frame>& frames,
    double fraction,
    std::vector<Frame>& output,
    CompressionError& error)
{
    if (!(fraction > 0.0 && fraction <= 1.0)) {
        std::ostringstream oss;
        oss << "drop-frames fraction " << fraction << " outside (0, 1]";
        return error.set(ErrorKind::INVALID_PARAMETER, oss.str());
    }

    const size_t keep = subsample_keep_count(frames.size(), fraction);
    if (keep >= frames.size()) {
        output = frames;
        return true;
    }

    const std::vector<size_t> kept = subsample_indices(frames.size(), keep);

    std::vector<uint64_t> delays(kept.size());
    for (size_t k = 0; k < kept.size(); ++k) {
        delays[k] = frames[kept[k]].delay;
    }

    // Dropped frames between kept[k] and kept[k + 1] go to whichever is closer
    for (size_t k = 0; k + 1 < kept.size(); ++k) {
        const size_t left = kept[k];
        const size_t right = kept[k + 1];
        for (size_t i = left + 1; i < right; ++i) {
            if (i - left <= right - i) {
                delays[k] += frames[i].delay;
            }
            else {
                delays[k + 1] += frames[i].delay;
            }
        }
    }

    std::vector<Frame> result;
    result.reserve(kept.size());
    for (size_t k = 0; k < kept.size(); ++k) {
        if (delays[k] > MAX_FRAME_DELAY) {
            std::ostringstream oss;
            oss << "frame " << kept[k] << " would need delay " << delays[k]
                << " after dropping neighbors (max " << MAX_FRAME_DELAY << ")";
            return error.set(ErrorKind::DELAY_OVERFLOW, oss.str());
        }
        result.push_back(frames[kept[k]]);
        result.back().delay = static_cast<uint32_t>(delays[k]);
    }

    output = std::move(result);
    return true;
}

} // namespace gifpress
