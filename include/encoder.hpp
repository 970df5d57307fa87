#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include "frame.hpp"

namespace gifpress {

/**
 * In-memory animation encoder
 *
 * The compression core only needs byte counts; any container encoder can
 * stand behind this interface.
 */
class AnimationEncoder {
public:
    virtual ~AnimationEncoder() = default;

    /**
     * Encode an animation into memory
     * @param animation Animation to encode
     * @param output Encoded bytes (output)
     * @return true on success
     */
    virtual bool encode(const Animation& animation, std::vector<uint8_t>& output) = 0;

    /**
     * Get last error message
     */
    virtual const std::string& last_error() const = 0;
};

/**
 * giflib encoder/decoder wrapper
 * Handles GIF89a with per-frame delays, transparency and loop count
 */
class GifCodec : public AnimationEncoder {
public:
    GifCodec();

    /**
     * Encode an animation as GIF
     *
     * The shared palette becomes the global color table and is used for
     * every frame whose pixels all belong to it; other frames get a local
     * table, quantized to 256 colors when they have more. Frames smaller
     * than the canvas are centered.
     */
    bool encode(const Animation& animation, std::vector<uint8_t>& output) override;

    /**
     * Decode a GIF into full-canvas RGBA frames
     * @param encoded Encoded data
     * @param encoded_size Size of encoded data
     * @param output Decoded animation (output)
     * @return true on success
     */
    bool decode(const uint8_t* encoded, size_t encoded_size, Animation& output);

    const std::string& last_error() const override { return last_error_; }

    /// Pixels of transparent frames below this alpha use the transparent index
    void set_alpha_cutoff(uint8_t cutoff) { alpha_cutoff_ = cutoff; }

    /// Seed used when a frame needs local quantization
    void set_quantize_seed(uint32_t seed) { quantize_seed_ = seed; }

private:
    std::string last_error_;
    uint8_t alpha_cutoff_;
    uint32_t quantize_seed_;
};

/**
 * Read a whole file into memory
 */
bool read_file_bytes(const std::string& path, std::vector<uint8_t>& output, std::string& error);

/**
 * Write a buffer to a file, replacing it
 */
bool write_file_bytes(const std::string& path, const std::vector<uint8_t>& data, std::string& error);

} // namespace gifpress
