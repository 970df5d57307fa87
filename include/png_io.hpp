#pragma once

#include <cstdint>
#include <string>
#include "frame.hpp"

namespace gifpress {

/**
 * Load any PNG as an 8-bit RGBA frame
 * @param path PNG file
 * @param frame Output frame (delay left at its default)
 * @param error Failure description (output)
 */
bool load_png_frame(const std::string& path, Frame& frame, std::string& error);

/**
 * Load every *.png in a directory, sorted by name, as one animation
 *
 * The canvas is the first frame's size. A frame is flagged transparent when
 * any pixel has alpha below 255.
 */
bool load_png_sequence(const std::string& dir, uint32_t delay, Animation& animation, std::string& error);

/**
 * Write a frame as an 8-bit RGBA PNG
 */
bool write_png_frame(const std::string& path, const Frame& frame, std::string& error);

/**
 * Write all frames as frame_000000.png, frame_000001.png, ... (creates dir)
 */
bool write_png_sequence(const std::string& dir, const Animation& animation, std::string& error);

} // namespace gifpress
