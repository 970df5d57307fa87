#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>

namespace gifpress {

/// Largest delay a frame can carry (GIF stores delays as 16-bit centiseconds)
constexpr uint32_t MAX_FRAME_DELAY = 65535;

/// Largest palette a frame can reference
constexpr uint32_t MAX_PALETTE_SIZE = 256;

/**
 * 8-bit RGB color
 */
struct Rgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    Rgb() : r(0), g(0), b(0) {}
    Rgb(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }

    // Packed 0x00RRGGBB key for hashing and sorting
    uint32_t key() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }
};

/**
 * Squared Euclidean distance in RGB space
 */
inline uint32_t rgb_distance_sq(const Rgb& a, const Rgb& b) {
    const int32_t dr = static_cast<int32_t>(a.r) - b.r;
    const int32_t dg = static_cast<int32_t>(a.g) - b.g;
    const int32_t db = static_cast<int32_t>(a.b) - b.b;
    return static_cast<uint32_t>(dr * dr + dg * dg + db * db);
}

/**
 * Bounded ordered color table with an optional reserved transparent slot.
 * The transparent slot, when present, follows the colors.
 */
struct Palette {
    std::vector<Rgb> colors;
    bool has_transparent;

    Palette() : has_transparent(false) {}

    /// Number of palette slots including the transparent one
    size_t size() const { return colors.size() + (has_transparent ? 1 : 0); }

    /// Index of the transparent slot (only meaningful when has_transparent)
    uint32_t transparent_index() const { return static_cast<uint32_t>(colors.size()); }

    bool empty() const { return colors.empty() && !has_transparent; }

    /// Index of the nearest color, ties broken by the lowest index
    uint32_t nearest(const Rgb& c) const;

    bool contains(const Rgb& c) const;
};

/**
 * One timed RGBA raster image
 */
struct Frame {
    std::vector<uint8_t> data;   // RGBA, 4 bytes per pixel
    uint32_t width;
    uint32_t height;
    uint32_t delay;              // 10 ms units, >= 1
    bool transparent;

    Frame() : width(0), height(0), delay(10), transparent(false) {}

    Frame(uint32_t w, uint32_t h, uint32_t delay_cs = 10)
        : data(static_cast<size_t>(w) * h * 4, 0), width(w), height(h),
          delay(delay_cs), transparent(false) {}

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }

    bool is_valid() const {
        return width > 0 && height > 0 && delay >= 1 && delay <= MAX_FRAME_DELAY
               && data.size() == pixel_count() * 4;
    }

    const uint8_t* pixel(size_t i) const { return &data[i * 4]; }
    uint8_t* pixel(size_t i) { return &data[i * 4]; }

    void fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);
};

/**
 * Ordered sequence of frames on a shared canvas
 */
struct Animation {
    std::vector<Frame> frames;
    uint32_t width;
    uint32_t height;
    bool has_palette;
    Palette palette;             // shared palette, valid when has_palette
    uint32_t loop_count;         // 0 = infinite

    Animation() : width(0), height(0), has_palette(false), loop_count(0) {}

    Animation(uint32_t w, uint32_t h)
        : width(w), height(h), has_palette(false), loop_count(0) {}

    size_t frame_count() const { return frames.size(); }

    /// Total duration in 10 ms units
    uint64_t total_duration() const;

    /// True if any frame carries the transparency flag
    bool uses_transparency() const;

    /// Append a frame, adopting its size as the canvas if this is the first one
    void add_frame(Frame frame);

    /**
     * Check the canvas invariant: every frame is valid and fits the canvas
     * @param error Description of the first violation (output)
     */
    bool validate(std::string& error) const;
};

} // namespace gifpress
