/**
 * @file quantize.cpp
 * @brief Weighted k-means palette construction and nearest-color remap
 */

#include "quantize.hpp"
#include "parallel.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace gifpress {

namespace {

struct Centroid {
    double r;
    double g;
    double b;

    Centroid() : r(0.0), g(0.0), b(0.0) {}
    explicit Centroid(const Rgb& c) : r(c.r), g(c.g), b(c.b) {}
};

inline double distance_sq(const Rgb& c, const Centroid& m)
{
    const double dr = c.r - m.r;
    const double dg = c.g - m.g;
    const double db = c.b - m.b;
    return dr * dr + dg * dg + db * db;
}

// Uniform value in [0, 1) from the raw engine output. mt19937's output
// sequence is fixed by the standard, distributions are not.
inline double next_unit(std::mt19937& rng)
{
    return static_cast<double>(rng()) / 4294967296.0;
}

size_t pick_weighted(const std::vector<double>& weights, double total, std::mt19937& rng)
{
    double target = next_unit(rng) * total;
    size_t last_positive = 0;

    for (size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) {
            continue;
        }
        last_positive = i;
        target -= weights[i];
        if (target < 0.0) {
            return i;
        }
    }

    return last_positive;
}

uint32_t nearest_centroid(const Rgb& c, const std::vector<Centroid>& centroids)
{
    uint32_t best = 0;
    double best_dist = std::numeric_limits<double>::max();

    for (size_t j = 0; j < centroids.size(); ++j) {
        const double d = distance_sq(c, centroids[j]);
        if (d < best_dist) {
            best_dist = d;
            best = static_cast<uint32_t>(j);
        }
    }

    return best;
}

uint8_t round_channel(double v)
{
    const long r = std::lround(v);
    return static_cast<uint8_t>(std::min(255L, std::max(0L, r)));
}

std::vector<Rgb> sorted_colors(const std::vector<ColorSample>& samples)
{
    std::vector<Rgb> colors;
    colors.reserve(samples.size());
    for (const ColorSample& s : samples) {
        colors.push_back(s.color);
    }
    std::sort(colors.begin(), colors.end(),
              [](const Rgb& a, const Rgb& b) { return a.key() < b.key(); });
    return colors;
}

} // anonymous namespace

std::vector<ColorSample> collect_color_histogram(
    const std::vector<Frame>& frames,
    bool skip_transparent,
    uint8_t alpha_cutoff)
{
    std::unordered_map<uint32_t, uint64_t> counts;

    for (const Frame& frame : frames) {
        const size_t pixel_count = frame.pixel_count();
        const uint8_t* p = frame.data.data();

        for (size_t i = 0; i < pixel_count; ++i, p += 4) {
            if (skip_transparent && p[3] < alpha_cutoff) {
                continue;
            }
            const uint32_t key = (static_cast<uint32_t>(p[0]) << 16)
                               | (static_cast<uint32_t>(p[1]) << 8) | p[2];
            counts[key]++;
        }
    }

    std::vector<ColorSample> samples;
    samples.reserve(counts.size());
    for (const auto& entry : counts) {
        const uint32_t key = entry.first;
        samples.emplace_back(
            Rgb(static_cast<uint8_t>(key >> 16), static_cast<uint8_t>(key >> 8), static_cast<uint8_t>(key)),
            entry.second);
    }

    std::sort(samples.begin(), samples.end(),
              [](const ColorSample& a, const ColorSample& b) { return a.color.key() < b.color.key(); });

    return samples;
}

std::vector<ColorSample> bucket_color_histogram(const std::vector<ColorSample>& samples)
{
    struct Bucket {
        double r;
        double g;
        double b;
        uint64_t weight;

        Bucket() : r(0.0), g(0.0), b(0.0), weight(0) {}
    };

    // 5 bits per channel, same crush as a 15-bit palette lookup
    std::vector<Bucket> buckets(1u << 15);

    for (const ColorSample& s : samples) {
        const uint32_t crushed = ((s.color.r >> 3) << 10) | ((s.color.g >> 3) << 5) | (s.color.b >> 3);
        Bucket& bucket = buckets[crushed];
        const double w = static_cast<double>(s.weight);
        bucket.r += s.color.r * w;
        bucket.g += s.color.g * w;
        bucket.b += s.color.b * w;
        bucket.weight += s.weight;
    }

    std::vector<ColorSample> merged;
    for (const Bucket& bucket : buckets) {
        if (bucket.weight == 0) {
            continue;
        }
        const double w = static_cast<double>(bucket.weight);
        merged.emplace_back(
            Rgb(round_channel(bucket.r / w), round_channel(bucket.g / w), round_channel(bucket.b / w)),
            bucket.weight);
    }

    return merged;
}

std::vector<Rgb> cluster_colors(
    const std::vector<ColorSample>& samples,
    uint32_t k,
    uint32_t seed,
    uint32_t max_iterations)
{
    if (samples.empty() || k == 0) {
        return std::vector<Rgb>();
    }

    if (k >= samples.size()) {
        return sorted_colors(samples);
    }

    const size_t n = samples.size();
    std::mt19937 rng(seed);

    // k-means++ seeding: first center by weight, then by weight * D(x)^2
    std::vector<Centroid> centroids;
    centroids.reserve(k);

    std::vector<double> weights(n);
    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        weights[i] = static_cast<double>(samples[i].weight);
        total += weights[i];
    }
    centroids.emplace_back(samples[pick_weighted(weights, total, rng)].color);

    std::vector<double> best_dist(n, std::numeric_limits<double>::max());
    while (centroids.size() < k) {
        total = 0.0;
        for (size_t i = 0; i < n; ++i) {
            best_dist[i] = std::min(best_dist[i], distance_sq(samples[i].color, centroids.back()));
            weights[i] = best_dist[i] * static_cast<double>(samples[i].weight);
            total += weights[i];
        }
        if (total <= 0.0) {
            break;  // every sample already sits on a center
        }
        centroids.emplace_back(samples[pick_weighted(weights, total, rng)].color);
    }

    // Lloyd iterations
    const uint32_t cluster_count = static_cast<uint32_t>(centroids.size());
    const uint32_t iterations = std::max<uint32_t>(1, max_iterations);
    std::vector<uint32_t> assignment(n, UINT32_MAX);
    std::vector<uint32_t> next(n);
    const long sample_count = static_cast<long>(n);

    for (uint32_t iter = 0; iter < iterations; ++iter) {
        GIFPRESS_PARALLEL_FOR
        for (long i = 0; i < sample_count; ++i) {
            next[static_cast<size_t>(i)] = nearest_centroid(samples[static_cast<size_t>(i)].color, centroids);
        }

        if (next == assignment) {
            break;
        }
        assignment.swap(next);

        std::vector<Centroid> sums(cluster_count);
        std::vector<double> mass(cluster_count, 0.0);
        for (size_t i = 0; i < n; ++i) {
            const uint32_t c = assignment[i];
            const double w = static_cast<double>(samples[i].weight);
            sums[c].r += samples[i].color.r * w;
            sums[c].g += samples[i].color.g * w;
            sums[c].b += samples[i].color.b * w;
            mass[c] += w;
        }

        for (uint32_t c = 0; c < cluster_count; ++c) {
            if (mass[c] > 0.0) {
                centroids[c].r = sums[c].r / mass[c];
                centroids[c].g = sums[c].g / mass[c];
                centroids[c].b = sums[c].b / mass[c];
                continue;
            }

            // Empty cluster: move it onto the worst-served sample
            size_t farthest = 0;
            double farthest_cost = -1.0;
            for (size_t i = 0; i < n; ++i) {
                const double cost = distance_sq(samples[i].color, centroids[assignment[i]])
                                  * static_cast<double>(samples[i].weight);
                if (cost > farthest_cost) {
                    farthest_cost = cost;
                    farthest = i;
                }
            }
            centroids[c] = Centroid(samples[farthest].color);
            assignment[farthest] = c;
        }
    }

    std::vector<Rgb> colors;
    std::unordered_set<uint32_t> seen;
    for (const Centroid& m : centroids) {
        const Rgb c(round_channel(m.r), round_channel(m.g), round_channel(m.b));
        if (seen.insert(c.key()).second) {
            colors.push_back(c);
        }
    }

    std::sort(colors.begin(), colors.end(),
              [](const Rgb& a, const Rgb& b) { return a.key() < b.key(); });

    return colors;
}

bool quantize_frames(
    const std::vector<Frame>& frames,
    const QuantizerParams& params,
    bool use_transparency,
    std::vector<Frame>& output,
    Palette& palette,
    CompressionError& error)
{
    if (params.max_colors < 2 || params.max_colors > MAX_PALETTE_SIZE) {
        std::ostringstream oss;
        oss << "quantizer max_colors " << params.max_colors << " outside [2, 256]";
        return error.set(ErrorKind::INVALID_PARAMETER, oss.str());
    }

    // The transparent slot counts toward the palette bound
    const uint32_t color_budget = use_transparency ? params.max_colors - 1 : params.max_colors;

    const std::vector<ColorSample> samples =
        collect_color_histogram(frames, use_transparency, params.alpha_cutoff);

    Palette result_palette;
    result_palette.has_transparent = use_transparency;

    if (samples.size() <= color_budget) {
        result_palette.colors = sorted_colors(samples);
    }
    else if (samples.size() > MAX_CLUSTER_SAMPLES) {
        result_palette.colors = cluster_colors(
            bucket_color_histogram(samples), color_budget, params.seed, params.max_iterations);
    }
    else {
        result_palette.colors = cluster_colors(samples, color_budget, params.seed, params.max_iterations);
    }

    // Nearest entry for every distinct source color, shared read-only below
    std::vector<uint32_t> nearest(samples.size());
    const long sample_count = static_cast<long>(samples.size());

    GIFPRESS_PARALLEL_FOR
    for (long i = 0; i < sample_count; ++i) {
        nearest[static_cast<size_t>(i)] = result_palette.nearest(samples[static_cast<size_t>(i)].color);
    }

    std::unordered_map<uint32_t, uint32_t> lookup;
    lookup.reserve(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        lookup.emplace(samples[i].color.key(), nearest[i]);
    }

    std::vector<Frame> result(frames);
    const long frame_count = static_cast<long>(result.size());
    const uint8_t cutoff = params.alpha_cutoff;

    GIFPRESS_PARALLEL_FOR
    for (long f = 0; f < frame_count; ++f) {
        Frame& frame = result[static_cast<size_t>(f)];
        const size_t pixel_count = frame.pixel_count();
        uint8_t* p = frame.data.data();

        for (size_t i = 0; i < pixel_count; ++i, p += 4) {
            if (use_transparency && p[3] < cutoff) {
                p[0] = p[1] = p[2] = p[3] = 0;
                frame.transparent = true;
                continue;
            }

            const Rgb source(p[0], p[1], p[2]);
            const auto it = lookup.find(source.key());
            const uint32_t index = (it != lookup.end()) ? it->second : result_palette.nearest(source);
            const Rgb& mapped = result_palette.colors[index];

            p[0] = mapped.r;
            p[1] = mapped.g;
            p[2] = mapped.b;
            if (use_transparency) {
                p[3] = 255;
            }
        }
    }

    output = std::move(result);
    palette = std::move(result_palette);
    return true;
}

} // namespace gifpress
