/**
 * @file png_io.cpp
 * @brief PNG frame import/export via libpng
 */

#include "png_io.hpp"
#include <png.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace gifpress {

bool load_png_frame(const std::string& path, Frame& frame, std::string& error)
{
    FILE* fp = fopen(path.c_str(), "rb");
    if (!fp) {
        error = "failed to open PNG: " + path;
        return false;
    }

    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        error = "failed to create PNG read struct";
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        fclose(fp);
        error = "failed to create PNG info struct";
        return false;
    }

    // Declared before setjmp so longjmp leaves them in a defined state
    std::vector<png_bytep> row_pointers;
    Frame loaded;

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        fclose(fp);
        error = "failed to decode PNG: " + path;
        return false;
    }

    png_init_io(png, fp);
    png_read_info(png, info);

    const uint32_t width = png_get_image_width(png, info);
    const uint32_t height = png_get_image_height(png, info);
    const int bit_depth = png_get_bit_depth(png, info);
    const int color_type = png_get_color_type(png, info);

    // Normalize everything to 8-bit RGBA
    if (bit_depth == 16) {
        png_set_strip_16(png);
    }
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(png);
    }
    if (png_get_valid(png, info, PNG_INFO_tRNS)) {
        png_set_tRNS_to_alpha(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(png);
    }
    if (!(color_type & PNG_COLOR_MASK_ALPHA) && !png_get_valid(png, info, PNG_INFO_tRNS)) {
        png_set_filler(png, 0xff, PNG_FILLER_AFTER);
    }
    png_set_interlace_handling(png);
    png_read_update_info(png, info);

    loaded = Frame(width, height);
    row_pointers.resize(height);
    for (uint32_t y = 0; y < height; ++y) {
        row_pointers[y] = &loaded.data[static_cast<size_t>(y) * width * 4];
    }

    png_read_image(png, row_pointers.data());
    png_read_end(png, nullptr);

    png_destroy_read_struct(&png, &info, nullptr);
    fclose(fp);

    loaded.transparent = false;
    for (size_t i = 0; i < loaded.pixel_count(); ++i) {
        if (loaded.pixel(i)[3] < 255) {
            loaded.transparent = true;
            break;
        }
    }

    frame = std::move(loaded);
    return true;
}

bool load_png_sequence(const std::string& dir, uint32_t delay, Animation& animation, std::string& error)
{
    std::vector<std::string> input_files;
    DIR* d = opendir(dir.c_str());
    if (!d) {
        error = "failed to open frame directory: " + dir;
        return false;
    }

    struct dirent* entry;
    while ((entry = readdir(d)) != nullptr) {
        std::string filename = entry->d_name;
        if (filename.length() > 4 && filename.substr(filename.length() - 4) == ".png") {
            input_files.push_back(dir + "/" + filename);
        }
    }
    closedir(d);

    if (input_files.empty()) {
        error = "no PNG files found in " + dir;
        return false;
    }

    std::sort(input_files.begin(), input_files.end());

    Animation result;
    for (size_t i = 0; i < input_files.size(); ++i) {
        Frame frame;
        if (!load_png_frame(input_files[i], frame, error)) {
            return false;
        }
        frame.delay = delay;

        if (i == 0) {
            result = Animation(frame.width, frame.height);
        }
        else if (frame.width > result.width || frame.height > result.height) {
            error = "frame larger than the first frame: " + input_files[i];
            return false;
        }

        result.add_frame(std::move(frame));
    }

    animation = std::move(result);
    return true;
}

bool write_png_frame(const std::string& path, const Frame& frame, std::string& error)
{
    if (!frame.is_valid()) {
        error = "invalid frame for " + path;
        return false;
    }

    FILE* fp = fopen(path.c_str(), "wb");
    if (!fp) {
        error = "failed to create PNG: " + path;
        return false;
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        error = "failed to create PNG write struct";
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        fclose(fp);
        error = "failed to create PNG info struct";
        return false;
    }

    std::vector<png_bytep> row_pointers(frame.height);

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        error = "failed to encode PNG: " + path;
        return false;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, frame.width, frame.height, 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (uint32_t y = 0; y < frame.height; ++y) {
        row_pointers[y] = const_cast<png_bytep>(&frame.data[static_cast<size_t>(y) * frame.width * 4]);
    }

    png_write_image(png, row_pointers.data());
    png_write_end(png, nullptr);

    png_destroy_write_struct(&png, &info);

    if (fclose(fp) != 0) {
        error = "failed to finish PNG: " + path;
        return false;
    }

    return true;
}

bool write_png_sequence(const std::string& dir, const Animation& animation, std::string& error)
{
    struct stat st;
    if (stat(dir.c_str(), &st) != 0) {
        if (mkdir(dir.c_str(), 0755) != 0) {
            error = "failed to create directory " + dir + ": " + std::strerror(errno);
            return false;
        }
    }

    for (size_t i = 0; i < animation.frames.size(); ++i) {
        std::ostringstream filename;
        filename << dir << "/frame_" << std::setw(6) << std::setfill('0') << i << ".png";
        if (!write_png_frame(filename.str(), animation.frames[i], error)) {
            return false;
        }
    }

    return true;
}

} // namespace gifpress
