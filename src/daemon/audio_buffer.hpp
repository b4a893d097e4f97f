#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <vector>

struct WriteOutcome {
    size_t accepted_count = 0;
    size_t dropped_count = 0;
};

// Lock-free single-producer single-consumer ring of int16 samples.
// Producer (capture callback) calls write(). Consumer (segmenter) calls read().
// A full ring never refuses a write: the oldest unread samples are overwritten
// and counted in dropped().
class StreamingAudioBuffer {
public:
    explicit StreamingAudioBuffer(size_t capacity_samples)
        : buf_(checked_capacity(capacity_samples)), capacity_(capacity_samples) {}

    StreamingAudioBuffer(const StreamingAudioBuffer&) = delete;
    StreamingAudioBuffer& operator=(const StreamingAudioBuffer&) = delete;

    // Producer: never blocks, never allocates.
    WriteOutcome write(std::span<const int16_t> samples) {
        size_t len = samples.size();
        if (len == 0) return {};

        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t used = std::min(w - r, capacity_);
        size_t dropped = used + len > capacity_ ? used + len - capacity_ : 0;

        // Only the newest capacity_ samples of an oversized write survive.
        size_t skip = len > capacity_ ? len - capacity_ : 0;
        auto src = samples.subspan(skip);

        // Announce the range before touching storage so a concurrent reader
        // can tell which of its copied samples were overwritten.
        write_claim_.store(w + len, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);

        copy_in(w + skip, src);

        write_pos_.store(w + len, std::memory_order_release);
        if (dropped > 0) {
            dropped_.fetch_add(dropped, std::memory_order_relaxed);
        }
        return {src.size(), dropped};
    }

    // Consumer: copy up to dest.size() samples, advancing the read cursor.
    // Returns the number of samples copied.
    size_t read(std::span<int16_t> dest) {
        size_t r = read_pos_.load(std::memory_order_acquire);
        size_t w = write_pos_.load(std::memory_order_acquire);

        // Producer lapped us: everything older than w - capacity_ is gone.
        size_t start = (w - r > capacity_) ? w - capacity_ : r;
        size_t n = std::min(dest.size(), w - start);

        if (n > 0) {
            copy_out(start, dest.first(n));
        }

        std::atomic_thread_fence(std::memory_order_acquire);
        size_t claim = write_claim_.load(std::memory_order_relaxed);
        size_t valid_from = claim > capacity_ ? claim - capacity_ : 0;
        size_t torn = valid_from > start ? std::min(valid_from - start, n) : 0;

        // A reset() between our loads and here invalidates the whole copy.
        if (!read_pos_.compare_exchange_strong(r, start + n, std::memory_order_acq_rel)) {
            return 0;
        }

        if (torn > 0) {
            std::memmove(dest.data(), dest.data() + torn, (n - torn) * sizeof(int16_t));
            n -= torn;
        }
        return n;
    }

    // Consumer: read everything currently available, up to max_samples.
    std::vector<int16_t> read_available(size_t max_samples = SIZE_MAX) {
        size_t n = std::min(used(), max_samples);
        if (n == 0) return {};

        std::vector<int16_t> out(n);
        out.resize(read(out));
        return out;
    }

    size_t capacity() const { return capacity_; }

    size_t used() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return std::min(w - r, capacity_);
    }

    // Total samples overwritten before the consumer read them.
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    uint64_t total_written() const { return write_pos_.load(std::memory_order_acquire); }

    // Discard unread samples. The producer must be quiescent (stream closed);
    // a read() racing with reset() returns nothing.
    void reset() {
        size_t w = write_pos_.load(std::memory_order_acquire);
        read_pos_.store(w, std::memory_order_release);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    static size_t checked_capacity(size_t capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("audio buffer capacity must be positive");
        }
        return capacity;
    }

    // Samples are copied one relaxed atomic access at a time: on overrun the
    // producer may be rewriting slots the consumer is copying (seqlock), and
    // write_claim_ tells the reader which of its samples to throw away.
    static void store_samples(int16_t* dst, const int16_t* src, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            std::atomic_ref<int16_t>(dst[i]).store(src[i], std::memory_order_relaxed);
        }
    }

    static void load_samples(int16_t* dst, int16_t* src, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            dst[i] = std::atomic_ref<int16_t>(src[i]).load(std::memory_order_relaxed);
        }
    }

    void copy_in(size_t pos, std::span<const int16_t> src) {
        size_t offset = pos % capacity_;
        size_t first = std::min(src.size(), capacity_ - offset);
        store_samples(buf_.data() + offset, src.data(), first);
        if (first < src.size()) {
            store_samples(buf_.data(), src.data() + first, src.size() - first);
        }
    }

    void copy_out(size_t pos, std::span<int16_t> dst) {
        size_t offset = pos % capacity_;
        size_t first = std::min(dst.size(), capacity_ - offset);
        load_samples(dst.data(), buf_.data() + offset, first);
        if (first < dst.size()) {
            load_samples(dst.data() + first, buf_.data(), dst.size() - first);
        }
    }

    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> write_claim_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<uint64_t> dropped_{0};
};
