/**
 * @file stage.cpp
 * @brief Stage descriptors, parsing and dispatch
 */

#include "stage.hpp"
#include "dedup.hpp"
#include "simplify.hpp"
#include "subsample.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace gifpress {

namespace {

std::string trim(const std::string& s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Copy everything except the frames
Animation copy_header(const Animation& input)
{
    Animation out(input.width, input.height);
    out.loop_count = input.loop_count;
    out.has_palette = input.has_palette;
    out.palette = input.palette;
    return out;
}

} // anonymous namespace

Stage Stage::dedup(uint32_t threshold)
{
    Stage s;
    s.kind = StageKind::DEDUP;
    s.threshold = threshold;
    return s;
}

Stage Stage::quantize(uint32_t max_colors)
{
    Stage s;
    s.kind = StageKind::QUANTIZE;
    s.max_colors = max_colors;
    return s;
}

Stage Stage::simplify(uint32_t quality)
{
    Stage s;
    s.kind = StageKind::SIMPLIFY;
    s.quality = quality;
    return s;
}

Stage Stage::drop_frames(double fraction)
{
    Stage s;
    s.kind = StageKind::DROP_FRAMES;
    s.fraction = fraction;
    return s;
}

std::string Stage::describe() const
{
    std::ostringstream oss;
    switch (kind) {
        case StageKind::DEDUP:
            oss << "Dedup(" << threshold << ")";
            break;
        case StageKind::QUANTIZE:
            oss << "Quantize(" << max_colors << ")";
            break;
        case StageKind::SIMPLIFY:
            oss << "Simplify(" << quality << ")";
            break;
        case StageKind::DROP_FRAMES:
            oss << "DropFrames(" << std::fixed << std::setprecision(2) << fraction << ")";
            break;
    }
    return oss.str();
}

bool Stage::validate(std::string& error) const
{
    switch (kind) {
        case StageKind::DEDUP:
            if (threshold > 255) {
                error = describe() + ": threshold must be in [0, 255]";
                return false;
            }
            return true;
        case StageKind::QUANTIZE:
            if (max_colors < 2 || max_colors > MAX_PALETTE_SIZE) {
                error = describe() + ": max_colors must be in [2, 256]";
                return false;
            }
            return true;
        case StageKind::SIMPLIFY:
            if (quality > 100) {
                error = describe() + ": quality must be in [0, 100]";
                return false;
            }
            return true;
        case StageKind::DROP_FRAMES:
            if (!(fraction > 0.0 && fraction <= 1.0)) {
                error = describe() + ": fraction must be in (0, 1]";
                return false;
            }
            return true;
    }
    error = "unknown stage kind";
    return false;
}

bool Stage::operator==(const Stage& o) const
{
    if (kind != o.kind) {
        return false;
    }
    switch (kind) {
        case StageKind::DEDUP: return threshold == o.threshold;
        case StageKind::QUANTIZE: return max_colors == o.max_colors;
        case StageKind::SIMPLIFY: return quality == o.quality;
        case StageKind::DROP_FRAMES: return fraction == o.fraction;
    }
    return false;
}

std::vector<Stage> reference_stages()
{
    return {
        Stage::dedup(10),
        Stage::quantize(128),
        Stage::simplify(80),
        Stage::quantize(64),
        Stage::simplify(60),
        Stage::quantize(32),
        Stage::simplify(40),
        Stage::dedup(5),
        Stage::quantize(16),
        Stage::drop_frames(0.70),
    };
}

bool parse_stage(const std::string& text, Stage& stage, std::string& error)
{
    const std::string s = trim(text);
    const size_t open = s.find('(');
    const size_t close = s.rfind(')');

    if (open == std::string::npos || close == std::string::npos || close < open || close != s.size() - 1) {
        error = "malformed stage '" + text + "', expected Name(value)";
        return false;
    }

    const std::string name = to_lower(trim(s.substr(0, open)));
    const std::string arg = trim(s.substr(open + 1, close - open - 1));

    if (arg.empty() || arg[0] == '-') {
        error = "stage '" + text + "' needs a non-negative argument";
        return false;
    }

    try {
        size_t consumed = 0;
        Stage parsed;

        if (name == "dedup") {
            parsed = Stage::dedup(static_cast<uint32_t>(std::stoul(arg, &consumed)));
        }
        else if (name == "quantize") {
            parsed = Stage::quantize(static_cast<uint32_t>(std::stoul(arg, &consumed)));
        }
        else if (name == "simplify") {
            parsed = Stage::simplify(static_cast<uint32_t>(std::stoul(arg, &consumed)));
        }
        else if (name == "dropframes") {
            parsed = Stage::drop_frames(std::stod(arg, &consumed));
        }
        else {
            error = "unknown stage '" + trim(s.substr(0, open)) + "'";
            return false;
        }

        if (consumed != arg.size()) {
            error = "trailing characters in stage argument '" + arg + "'";
            return false;
        }

        if (!parsed.validate(error)) {
            return false;
        }

        stage = parsed;
        return true;
    }
    catch (const std::exception& e) {
        error = "invalid stage argument '" + arg + "': " + e.what();
        return false;
    }
}

bool apply_stage(
    const Stage& stage,
    const Animation& input,
    const StageContext& context,
    Animation& output,
    CompressionError& error)
{
    std::string message;
    if (!stage.validate(message)) {
        return error.set(ErrorKind::INVALID_PARAMETER, message);
    }

    Animation result = copy_header(input);

    switch (stage.kind) {
        case StageKind::DEDUP:
            if (!dedupe_frames(input.frames, stage.threshold, result.frames, error)) {
                return false;
            }
            break;

        case StageKind::QUANTIZE: {
            const QuantizerParams params(
                stage.max_colors, context.quantize_seed, context.alpha_cutoff, context.kmeans_iterations);
            Palette palette;
            if (!quantize_frames(input.frames, params, input.uses_transparency(), result.frames, palette, error)) {
                return false;
            }
            result.has_palette = true;
            result.palette = std::move(palette);
            break;
        }

        case StageKind::SIMPLIFY:
            if (!simplify_frames(input.frames, stage.quality, result.frames, error)) {
                return false;
            }
            if (result.has_palette) {
                result.palette = simplify_palette(
                    input.palette, build_rounding_table(quality_to_step(stage.quality)));
            }
            break;

        case StageKind::DROP_FRAMES:
            if (!drop_frames(input.frames, stage.fraction, result.frames, error)) {
                return false;
            }
            break;
    }

    output = std::move(result);
    return true;
}

} // namespace gifpress
