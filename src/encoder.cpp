/**
 * @file encoder.cpp
 * @brief giflib encoder/decoder wrapper working entirely in memory
 *
 * Encoding writes through an output callback into a byte vector, so the
 * size probe can measure candidates without touching the filesystem.
 * Decoding composites every image onto a full-canvas RGBA buffer.
 */

#include "encoder.hpp"
#include "quantize.hpp"
#include <gif_lib.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace gifpress {

namespace {

struct MemoryReader {
    const uint8_t* data;
    size_t size;
    size_t offset;
};

int write_to_buffer(GifFileType* gif, const GifByteType* buf, int len)
{
    auto* out = static_cast<std::vector<uint8_t>*>(gif->UserData);
    out->insert(out->end(), buf, buf + len);
    return len;
}

int read_from_buffer(GifFileType* gif, GifByteType* buf, int len)
{
    auto* reader = static_cast<MemoryReader*>(gif->UserData);
    const size_t remaining = reader->size - reader->offset;
    const size_t count = std::min(remaining, static_cast<size_t>(len));
    std::memcpy(buf, reader->data + reader->offset, count);
    reader->offset += count;
    return static_cast<int>(count);
}

std::string gif_error_text(int code)
{
    const char* text = GifErrorString(code);
    std::ostringstream oss;
    oss << (text ? text : "unknown giflib error") << " (" << code << ")";
    return oss.str();
}

struct ColorMapDeleter {
    void operator()(ColorMapObject* map) const { GifFreeMapObject(map); }
};
using ColorMapPtr = std::unique_ptr<ColorMapObject, ColorMapDeleter>;

// GIF color tables hold a power-of-two number of entries, at least 2
ColorMapPtr make_color_map(const Palette& palette)
{
    const size_t used = palette.size();
    int count = 2;
    while (static_cast<size_t>(count) < used) {
        count <<= 1;
    }

    std::vector<GifColorType> table(static_cast<size_t>(count));
    for (size_t i = 0; i < palette.colors.size(); ++i) {
        table[i].Red = palette.colors[i].r;
        table[i].Green = palette.colors[i].g;
        table[i].Blue = palette.colors[i].b;
    }

    return ColorMapPtr(GifMakeMapObject(count, table.data()));
}

// Map every pixel to a palette index; false if some opaque pixel is missing
// from the palette or a transparent pixel has no slot
bool index_frame(const Frame& frame, const Palette& palette, uint8_t alpha_cutoff, std::vector<GifByteType>& indices)
{
    std::unordered_map<uint32_t, uint32_t> lookup;
    lookup.reserve(palette.colors.size());
    for (size_t i = 0; i < palette.colors.size(); ++i) {
        lookup.emplace(palette.colors[i].key(), static_cast<uint32_t>(i));
    }

    const size_t pixel_count = frame.pixel_count();
    indices.resize(pixel_count);

    for (size_t i = 0; i < pixel_count; ++i) {
        const uint8_t* p = frame.pixel(i);

        if (frame.transparent && p[3] < alpha_cutoff) {
            if (!palette.has_transparent) {
                return false;
            }
            indices[i] = static_cast<GifByteType>(palette.transparent_index());
            continue;
        }

        const auto it = lookup.find(Rgb(p[0], p[1], p[2]).key());
        if (it == lookup.end()) {
            return false;
        }
        indices[i] = static_cast<GifByteType>(it->second);
    }

    return true;
}

// Local color table for one frame: its own colors when they fit,
// otherwise a 256-entry quantized table
bool build_local_table(
    const Frame& frame,
    uint8_t alpha_cutoff,
    uint32_t seed,
    Palette& palette,
    std::vector<GifByteType>& indices,
    std::string& error)
{
    palette = Palette();
    palette.has_transparent = frame.transparent;
    const size_t budget = MAX_PALETTE_SIZE - (frame.transparent ? 1 : 0);

    std::unordered_map<uint32_t, uint32_t> seen;
    const size_t pixel_count = frame.pixel_count();
    bool fits = true;

    for (size_t i = 0; i < pixel_count && fits; ++i) {
        const uint8_t* p = frame.pixel(i);
        if (frame.transparent && p[3] < alpha_cutoff) {
            continue;
        }
        const Rgb c(p[0], p[1], p[2]);
        if (seen.emplace(c.key(), static_cast<uint32_t>(palette.colors.size())).second) {
            palette.colors.push_back(c);
            fits = palette.colors.size() <= budget;
        }
    }

    if (fits) {
        return index_frame(frame, palette, alpha_cutoff, indices);
    }

    std::vector<Frame> quantized;
    CompressionError quantize_error;
    const QuantizerParams params(MAX_PALETTE_SIZE, seed, alpha_cutoff);
    if (!quantize_frames(std::vector<Frame>(1, frame), params, frame.transparent, quantized, palette, quantize_error)) {
        error = "local quantization failed: " + quantize_error.message;
        return false;
    }

    if (!index_frame(quantized[0], palette, alpha_cutoff, indices)) {
        error = "quantized frame does not match its palette";
        return false;
    }

    return true;
}

bool put_loop_extension(GifFileType* gif, uint32_t loop_count)
{
    static const char NETSCAPE_ID[] = "NETSCAPE2.0";
    const GifByteType params[3] = {
        1,
        static_cast<GifByteType>(loop_count & 0xff),
        static_cast<GifByteType>((loop_count >> 8) & 0xff)
    };

    return EGifPutExtensionLeader(gif, APPLICATION_EXT_FUNC_CODE) != GIF_ERROR
        && EGifPutExtensionBlock(gif, 11, NETSCAPE_ID) != GIF_ERROR
        && EGifPutExtensionBlock(gif, 3, params) != GIF_ERROR
        && EGifPutExtensionTrailer(gif) != GIF_ERROR;
}

// NETSCAPE2.0 loop count from any extension list, if present
bool find_loop_count(const ExtensionBlock* blocks, int count, uint32_t& loop_count)
{
    for (int i = 0; i + 1 < count; ++i) {
        const ExtensionBlock& app = blocks[i];
        if (app.Function != APPLICATION_EXT_FUNC_CODE || app.ByteCount != 11) {
            continue;
        }
        if (std::memcmp(app.Bytes, "NETSCAPE2.0", 11) != 0 && std::memcmp(app.Bytes, "ANIMEXTS1.0", 11) != 0) {
            continue;
        }
        const ExtensionBlock& sub = blocks[i + 1];
        if (sub.Function == CONTINUE_EXT_FUNC_CODE && sub.ByteCount >= 3 && sub.Bytes[0] == 1) {
            loop_count = static_cast<uint32_t>(sub.Bytes[1]) | (static_cast<uint32_t>(sub.Bytes[2]) << 8);
            return true;
        }
    }
    return false;
}

} // anonymous namespace

GifCodec::GifCodec()
    : alpha_cutoff_(128)
    , quantize_seed_(1)
{
}

bool GifCodec::encode(const Animation& animation, std::vector<uint8_t>& output)
{
    last_error_.clear();

    if (animation.frames.empty()) {
        last_error_ = "cannot encode an animation without frames";
        return false;
    }

    std::string problem;
    if (!animation.validate(problem)) {
        last_error_ = "inconsistent animation: " + problem;
        return false;
    }

    if (animation.width > 65535 || animation.height > 65535) {
        last_error_ = "canvas exceeds GIF limits";
        return false;
    }

    std::vector<uint8_t> buffer;
    int error_code = 0;
    GifFileType* gif = EGifOpen(&buffer, write_to_buffer, &error_code);
    if (!gif) {
        last_error_ = "EGifOpen failed: " + gif_error_text(error_code);
        return false;
    }

    auto fail = [&](const std::string& what) {
        last_error_ = what + ": " + gif_error_text(gif->Error);
        int close_error = 0;
        EGifCloseFile(gif, &close_error);
        return false;
    };

    ColorMapPtr global_map;
    const bool use_global = animation.has_palette
                            && !animation.palette.empty()
                            && animation.palette.size() <= MAX_PALETTE_SIZE;
    if (use_global) {
        global_map = make_color_map(animation.palette);
        if (!global_map) {
            return fail("failed to build global color map");
        }
    }

    EGifSetGifVersion(gif, true);

    if (EGifPutScreenDesc(gif, static_cast<int>(animation.width), static_cast<int>(animation.height),
                          8, 0, global_map.get()) == GIF_ERROR) {
        return fail("failed to write screen descriptor");
    }

    if (!put_loop_extension(gif, animation.loop_count)) {
        return fail("failed to write loop extension");
    }

    std::vector<GifByteType> indices;

    for (size_t f = 0; f < animation.frames.size(); ++f) {
        const Frame& frame = animation.frames[f];

        ColorMapPtr local_map;
        int transparent_index = NO_TRANSPARENT_COLOR;

        if (use_global && index_frame(frame, animation.palette, alpha_cutoff_, indices)) {
            if (frame.transparent && animation.palette.has_transparent) {
                transparent_index = static_cast<int>(animation.palette.transparent_index());
            }
        }
        else {
            Palette local;
            std::string local_error;
            if (!build_local_table(frame, alpha_cutoff_, quantize_seed_, local, indices, local_error)) {
                std::ostringstream oss;
                oss << "frame " << f << ": " << local_error;
                return fail(oss.str());
            }
            local_map = make_color_map(local);
            if (!local_map) {
                return fail("failed to build local color map");
            }
            if (frame.transparent) {
                transparent_index = static_cast<int>(local.transparent_index());
            }
        }

        GraphicsControlBlock gcb;
        gcb.DisposalMode = frame.transparent ? DISPOSE_BACKGROUND : DISPOSE_DO_NOT;
        gcb.UserInputFlag = false;
        gcb.DelayTime = static_cast<int>(frame.delay);
        gcb.TransparentColor = transparent_index;

        GifByteType extension[4];
        const size_t extension_len = EGifGCBToExtension(&gcb, extension);
        if (EGifPutExtension(gif, GRAPHICS_EXT_FUNC_CODE, static_cast<int>(extension_len), extension) == GIF_ERROR) {
            return fail("failed to write graphics control block");
        }

        // Frames smaller than the canvas are centered
        const int left = static_cast<int>((animation.width - frame.width) / 2);
        const int top = static_cast<int>((animation.height - frame.height) / 2);
        const int width = static_cast<int>(frame.width);
        const int height = static_cast<int>(frame.height);

        if (EGifPutImageDesc(gif, left, top, width, height, false, local_map.get()) == GIF_ERROR) {
            return fail("failed to write image descriptor");
        }

        for (int y = 0; y < height; ++y) {
            if (EGifPutLine(gif, &indices[static_cast<size_t>(y) * frame.width], width) == GIF_ERROR) {
                return fail("failed to write image data");
            }
        }
    }

    if (EGifCloseFile(gif, &error_code) == GIF_ERROR) {
        last_error_ = "failed to finish GIF stream: " + gif_error_text(error_code);
        return false;
    }

    output.swap(buffer);
    return true;
}

bool GifCodec::decode(const uint8_t* encoded, size_t encoded_size, Animation& output)
{
    last_error_.clear();

    MemoryReader reader = { encoded, encoded_size, 0 };
    int error_code = 0;
    GifFileType* gif = DGifOpen(&reader, read_from_buffer, &error_code);
    if (!gif) {
        last_error_ = "DGifOpen failed: " + gif_error_text(error_code);
        return false;
    }

    auto close = [&]() {
        int close_error = 0;
        DGifCloseFile(gif, &close_error);
    };

    if (DGifSlurp(gif) == GIF_ERROR) {
        last_error_ = "DGifSlurp failed: " + gif_error_text(gif->Error);
        close();
        return false;
    }

    if (gif->SWidth <= 0 || gif->SHeight <= 0 || gif->ImageCount <= 0) {
        last_error_ = "GIF has no image data";
        close();
        return false;
    }

    const uint32_t canvas_w = static_cast<uint32_t>(gif->SWidth);
    const uint32_t canvas_h = static_cast<uint32_t>(gif->SHeight);

    Animation result(canvas_w, canvas_h);

    // Loop count lives either before the first image or in the trailing blocks
    uint32_t loop_count = 0;
    if (!find_loop_count(gif->SavedImages[0].ExtensionBlocks, gif->SavedImages[0].ExtensionBlockCount, loop_count)) {
        find_loop_count(gif->ExtensionBlocks, gif->ExtensionBlockCount, loop_count);
    }
    result.loop_count = loop_count;

    bool any_local_map = false;
    Frame canvas(canvas_w, canvas_h);
    canvas.fill(0, 0, 0, 0);

    for (int i = 0; i < gif->ImageCount; ++i) {
        const SavedImage& image = gif->SavedImages[i];
        const GifImageDesc& desc = image.ImageDesc;

        GraphicsControlBlock gcb;
        gcb.DisposalMode = DISPOSAL_UNSPECIFIED;
        gcb.UserInputFlag = false;
        gcb.DelayTime = 0;
        gcb.TransparentColor = NO_TRANSPARENT_COLOR;
        // Images without a graphics control block keep the defaults above
        if (DGifSavedExtensionToGCB(gif, i, &gcb) == GIF_ERROR) {
            gcb.DisposalMode = DISPOSAL_UNSPECIFIED;
            gcb.TransparentColor = NO_TRANSPARENT_COLOR;
        }

        const ColorMapObject* color_map = desc.ColorMap ? desc.ColorMap : gif->SColorMap;
        if (!color_map) {
            std::ostringstream oss;
            oss << "frame " << i << " has no color map";
            last_error_ = oss.str();
            close();
            return false;
        }
        any_local_map = any_local_map || desc.ColorMap != nullptr;

        const Frame previous = (gcb.DisposalMode == DISPOSE_PREVIOUS) ? canvas : Frame();

        for (int y = 0; y < desc.Height; ++y) {
            const int cy = desc.Top + y;
            if (cy < 0 || cy >= gif->SHeight) {
                continue;
            }
            for (int x = 0; x < desc.Width; ++x) {
                const int cx = desc.Left + x;
                if (cx < 0 || cx >= gif->SWidth) {
                    continue;
                }
                const int index = image.RasterBits[static_cast<size_t>(y) * desc.Width + x];
                if (index == gcb.TransparentColor || index >= color_map->ColorCount) {
                    continue;
                }
                const GifColorType& c = color_map->Colors[index];
                uint8_t* p = canvas.pixel(static_cast<size_t>(cy) * canvas_w + cx);
                p[0] = c.Red;
                p[1] = c.Green;
                p[2] = c.Blue;
                p[3] = 255;
            }
        }

        Frame frame = canvas;
        frame.delay = static_cast<uint32_t>(std::max(1, gcb.DelayTime));
        frame.transparent = false;
        for (size_t p = 0; p < frame.pixel_count(); ++p) {
            if (frame.pixel(p)[3] == 0) {
                frame.transparent = true;
                break;
            }
        }
        result.frames.push_back(std::move(frame));

        if (gcb.DisposalMode == DISPOSE_BACKGROUND) {
            for (int y = std::max(0, desc.Top); y < std::min(gif->SHeight, desc.Top + desc.Height); ++y) {
                for (int x = std::max(0, desc.Left); x < std::min(gif->SWidth, desc.Left + desc.Width); ++x) {
                    uint8_t* p = canvas.pixel(static_cast<size_t>(y) * canvas_w + x);
                    p[0] = p[1] = p[2] = p[3] = 0;
                }
            }
        }
        else if (gcb.DisposalMode == DISPOSE_PREVIOUS) {
            canvas = previous;
        }
    }

    // A global table only describes every frame when no image overrides it
    if (gif->SColorMap && !any_local_map) {
        result.has_palette = true;
        for (int i = 0; i < gif->SColorMap->ColorCount && result.palette.colors.size() < MAX_PALETTE_SIZE; ++i) {
            const GifColorType& c = gif->SColorMap->Colors[i];
            const Rgb color(c.Red, c.Green, c.Blue);
            if (!result.palette.contains(color)) {
                result.palette.colors.push_back(color);
            }
        }
        result.palette.has_transparent = result.uses_transparency() && result.palette.size() < MAX_PALETTE_SIZE;
        if (result.uses_transparency() && !result.palette.has_transparent) {
            result.has_palette = false;
        }
    }

    close();
    output = std::move(result);
    return true;
}

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& output, std::string& error)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        error = "failed to open " + path;
        return false;
    }

    output.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        error = "failed to read " + path;
        return false;
    }

    return true;
}

bool write_file_bytes(const std::string& path, const std::vector<uint8_t>& data, std::string& error)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        error = "failed to create " + path;
        return false;
    }

    ofs.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
        error = "failed to write " + path;
        return false;
    }

    return true;
}

} // namespace gifpress
