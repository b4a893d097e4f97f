#pragma once

#include <cstdint>
#include <span>
#include <string>

// In-memory RIFF/WAVE encoding of mono 16-bit PCM, for multipart uploads.
namespace wav {

constexpr size_t kHeaderSize = 44;

namespace detail {

inline void put_le(std::string& out, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
    }
}

} // namespace detail

inline std::string encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits = 16;
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::string out;
    out.reserve(kHeaderSize + data_bytes);

    out.append("RIFF");
    detail::put_le(out, 36 + data_bytes, 4);
    out.append("WAVEfmt ");
    detail::put_le(out, 16, 4);                              // fmt chunk size
    detail::put_le(out, 1, 2);                               // PCM
    detail::put_le(out, channels, 2);
    detail::put_le(out, sample_rate, 4);
    detail::put_le(out, sample_rate * channels * bits / 8, 4);
    detail::put_le(out, channels * bits / 8, 2);
    detail::put_le(out, bits, 2);
    out.append("data");
    detail::put_le(out, data_bytes, 4);

    for (int16_t s : samples) {
        detail::put_le(out, static_cast<uint16_t>(s), 2);
    }
    return out;
}

} // namespace wav
