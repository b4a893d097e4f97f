#pragma once

#include "audio_level.hpp"

#include <cstdint>
#include <span>

// Scores one analysis frame. Higher means more speech-like; the segmenter
// compares the score against its detection threshold.
class SpeechClassifier {
public:
    virtual ~SpeechClassifier() = default;
    virtual float score(std::span<const int16_t> frame) = 0;
};

// Frame energy as normalized RMS in [0, 1].
class EnergyClassifier : public SpeechClassifier {
public:
    float score(std::span<const int16_t> frame) override { return audio::rms_level(frame); }
};
