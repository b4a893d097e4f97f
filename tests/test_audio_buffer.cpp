#include <catch2/catch_test_macros.hpp>

#include "audio_buffer.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

std::vector<int16_t> ramp(int16_t from, size_t n) {
    std::vector<int16_t> v(n);
    std::iota(v.begin(), v.end(), from);
    return v;
}

} // namespace

TEST_CASE("StreamingAudioBuffer", "[audio_buffer]") {

    SECTION("ZeroCapacityRejected") {
        REQUIRE_THROWS_AS(StreamingAudioBuffer(0), std::invalid_argument);
    }

    SECTION("WriteThenRead") {
        StreamingAudioBuffer buf(16);
        auto in = ramp(1, 10);
        auto w = buf.write(in);
        REQUIRE(w.accepted_count == 10);
        REQUIRE(w.dropped_count == 0);
        REQUIRE(buf.used() == 10);

        auto out = buf.read_available();
        REQUIRE(out == in);
        REQUIRE(buf.used() == 0);
        REQUIRE(buf.total_written() == 10);
    }

    SECTION("PartialReads") {
        StreamingAudioBuffer buf(16);
        buf.write(ramp(0, 12));

        std::vector<int16_t> a(5);
        REQUIRE(buf.read(a) == 5);
        REQUIRE(a == ramp(0, 5));

        std::vector<int16_t> b(16);
        REQUIRE(buf.read(b) == 7);
        b.resize(7);
        REQUIRE(b == ramp(5, 7));
    }

    SECTION("WrapAround") {
        StreamingAudioBuffer buf(8);
        for (int round = 0; round < 5; ++round) {
            auto in = ramp(static_cast<int16_t>(round * 6), 6);
            buf.write(in);
            REQUIRE(buf.read_available() == in);
        }
        REQUIRE(buf.dropped() == 0);
    }

    SECTION("OverflowDropsOldest") {
        StreamingAudioBuffer buf(8);
        buf.write(ramp(0, 6));
        auto w = buf.write(ramp(6, 6));
        REQUIRE(w.accepted_count == 6);
        REQUIRE(w.dropped_count == 4);
        REQUIRE(buf.dropped() == 4);
        REQUIRE(buf.used() == 8);

        // Newest capacity samples survive, in order
        REQUIRE(buf.read_available() == ramp(4, 8));
    }

    SECTION("OversizedWriteKeepsTail") {
        StreamingAudioBuffer buf(4);
        auto w = buf.write(ramp(0, 10));
        REQUIRE(w.accepted_count == 4);
        REQUIRE(w.dropped_count == 6);
        REQUIRE(buf.read_available() == ramp(6, 4));
    }

    SECTION("ResetDiscardsUnread") {
        StreamingAudioBuffer buf(8);
        buf.write(ramp(0, 10));
        REQUIRE(buf.dropped() == 2);

        buf.reset();
        REQUIRE(buf.used() == 0);
        REQUIRE(buf.dropped() == 0);
        REQUIRE(buf.read_available().empty());

        buf.write(ramp(100, 3));
        REQUIRE(buf.read_available() == ramp(100, 3));
    }

    SECTION("EmptyWriteIsNoop") {
        StreamingAudioBuffer buf(8);
        auto w = buf.write({});
        REQUIRE(w.accepted_count == 0);
        REQUIRE(buf.total_written() == 0);
    }
}

TEST_CASE("StreamingAudioBuffer concurrent producer", "[audio_buffer]") {
    // Large enough that the consumer keeps up: every sample arrives once, in order.
    StreamingAudioBuffer buf(1 << 16);
    constexpr int16_t kChunks = 2000;
    constexpr size_t kChunk = 160;

    std::thread producer([&] {
        std::vector<int16_t> chunk(kChunk);
        for (int16_t c = 0; c < kChunks; ++c) {
            std::fill(chunk.begin(), chunk.end(), c);
            buf.write(chunk);
            if (c % 64 == 0) std::this_thread::yield();
        }
    });

    std::vector<int16_t> received;
    received.reserve(kChunks * kChunk);
    std::vector<int16_t> tmp(1024);
    while (received.size() < kChunks * kChunk) {
        size_t n = buf.read(tmp);
        received.insert(received.end(), tmp.begin(), tmp.begin() + static_cast<std::ptrdiff_t>(n));
    }
    producer.join();

    REQUIRE(buf.dropped() == 0);
    for (size_t i = 0; i < received.size(); ++i) {
        REQUIRE(received[i] == static_cast<int16_t>(i / kChunk));
    }
}

TEST_CASE("StreamingAudioBuffer overrun while reading", "[audio_buffer]") {
    // The producer laps a small ring continuously; every read must still be
    // one contiguous run of the producer's counter.
    StreamingAudioBuffer buf(256);
    std::atomic<bool> done{false};

    std::thread producer([&] {
        std::vector<int16_t> chunk(96);
        uint16_t next = 0;
        for (int i = 0; i < 20000; ++i) {
            for (auto& s : chunk) s = static_cast<int16_t>(next++);
            buf.write(chunk);
        }
        done = true;
    });

    std::vector<int16_t> tmp(200);
    size_t reads = 0;
    size_t broken = 0;
    while (!done || buf.used() > 0) {
        size_t n = buf.read(tmp);
        if (n == 0) continue;
        ++reads;
        for (size_t i = 1; i < n; ++i) {
            if (static_cast<uint16_t>(tmp[i]) != static_cast<uint16_t>(tmp[i - 1] + 1)) ++broken;
        }
    }
    producer.join();

    REQUIRE(reads > 0);
    REQUIRE(broken == 0);
}
