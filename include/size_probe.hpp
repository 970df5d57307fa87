#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include "encoder.hpp"
#include "error.hpp"
#include "frame.hpp"

namespace gifpress {

/**
 * Measures the encoded size of a candidate animation in memory
 *
 * Nothing is written to disk. The bytes of the most recent successful
 * measurement are kept so the caller can take the accepted encoding.
 */
class SizeProbe {
public:
    explicit SizeProbe(AnimationEncoder& encoder);

    /**
     * Encode the animation and report its byte length
     * @param animation Candidate animation
     * @param size Encoded size in bytes (output)
     * @param error ENCODE_PROBE_FAILURE with the encoder's message (output)
     * @return true on success
     */
    bool measure(const Animation& animation, size_t& size, CompressionError& error);

    /// Number of measure() calls so far
    uint32_t probe_count() const { return probe_count_; }

    /// Cumulative time spent encoding, in milliseconds
    double total_probe_ms() const { return total_probe_ms_; }

    /// Duration of the most recent measurement, in milliseconds
    double last_probe_ms() const { return last_probe_ms_; }

    /// Move out the bytes of the last successful measurement
    std::vector<uint8_t> take_last_bytes();

private:
    AnimationEncoder& encoder_;
    std::vector<uint8_t> last_bytes_;
    uint32_t probe_count_;
    double total_probe_ms_;
    double last_probe_ms_;
};

} // namespace gifpress
