#include "size_probe.hpp"
#include <chrono>
#include <utility>

namespace gifpress {

SizeProbe::SizeProbe(AnimationEncoder& encoder)
    : encoder_(encoder)
    , probe_count_(0)
    , total_probe_ms_(0.0)
    , last_probe_ms_(0.0)
{
}

bool SizeProbe::measure(const Animation& animation, size_t& size, CompressionError& error)
{
    std::vector<uint8_t> bytes;

    const auto start = std::chrono::high_resolution_clock::now();
    const bool ok = encoder_.encode(animation, bytes);
    const auto end = std::chrono::high_resolution_clock::now();

    ++probe_count_;
    last_probe_ms_ = std::chrono::duration<double, std::milli>(end - start).count();
    total_probe_ms_ += last_probe_ms_;

    if (!ok) {
        return error.set(ErrorKind::ENCODE_PROBE_FAILURE, encoder_.last_error());
    }

    size = bytes.size();
    last_bytes_ = std::move(bytes);
    return true;
}

std::vector<uint8_t> SizeProbe::take_last_bytes()
{
    std::vector<uint8_t> out;
    out.swap(last_bytes_);
    return out;
}

} // namespace gifpress
