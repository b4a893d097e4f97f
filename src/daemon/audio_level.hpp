#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>

namespace audio {

// RMS of int16 samples normalized to [0, 1].
inline float rms_level(std::span<const int16_t> samples) {
    if (samples.empty()) return 0.0f;
    double acc = 0.0;
    for (auto s : samples) {
        acc += static_cast<double>(s) * static_cast<double>(s);
    }
    double rms = std::sqrt(acc / static_cast<double>(samples.size()));
    return static_cast<float>(std::min(rms / 32767.0, 1.0));
}

} // namespace audio
