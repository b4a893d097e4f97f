#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

// Overwrites sample storage through a volatile pointer so the stores
// cannot be elided as dead writes.
inline void secure_wipe(std::vector<int16_t>& samples) {
    volatile int16_t* p = samples.data();
    for (size_t i = 0; i < samples.size(); ++i) {
        p[i] = 0;
    }
    samples.clear();
    samples.shrink_to_fit();
}

// An owned copy of contiguous speech samples. Move-only; storage is wiped
// when the segment is consumed or destroyed.
class SpeechSegment {
public:
    SpeechSegment() = default;
    SpeechSegment(uint64_t sequence, std::vector<int16_t> samples, uint64_t start_offset,
                  uint32_t sample_rate, float confidence)
        : sequence_(sequence), samples_(std::move(samples)), length_(samples_.size()),
          start_offset_(start_offset), sample_rate_(sample_rate), confidence_(confidence) {}

    ~SpeechSegment() { wipe(); }

    SpeechSegment(const SpeechSegment&) = delete;
    SpeechSegment& operator=(const SpeechSegment&) = delete;

    SpeechSegment(SpeechSegment&& other) noexcept
        : sequence_(other.sequence_), samples_(std::move(other.samples_)),
          length_(other.length_), start_offset_(other.start_offset_), sample_rate_(other.sample_rate_),
          confidence_(other.confidence_) {
        other.samples_.clear();
    }

    SpeechSegment& operator=(SpeechSegment&& other) noexcept {
        if (this != &other) {
            wipe();
            sequence_ = other.sequence_;
            samples_ = std::move(other.samples_);
            length_ = other.length_;
            start_offset_ = other.start_offset_;
            sample_rate_ = other.sample_rate_;
            confidence_ = other.confidence_;
            other.samples_.clear();
        }
        return *this;
    }

    void wipe() { secure_wipe(samples_); }

    uint64_t sequence() const { return sequence_; }
    std::span<const int16_t> samples() const { return samples_; }
    bool empty() const { return samples_.empty(); }

    // Offset of the first sample, in samples since the session started.
    uint64_t start_offset() const { return start_offset_; }
    uint32_t sample_rate() const { return sample_rate_; }
    float confidence() const { return confidence_; }

    double start_s() const {
        return sample_rate_ ? static_cast<double>(start_offset_) / sample_rate_ : 0.0;
    }
    // Length at emission; unchanged by wipe().
    size_t length() const { return length_; }
    double duration_s() const {
        return sample_rate_ ? static_cast<double>(length_) / sample_rate_ : 0.0;
    }

private:
    uint64_t sequence_ = 0;
    std::vector<int16_t> samples_;
    size_t length_ = 0;
    uint64_t start_offset_ = 0;
    uint32_t sample_rate_ = 16000;
    float confidence_ = 0.0f;
};
