#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "audio_buffer.hpp"
#include "vad/speech_classifier.hpp"
#include "vad/voice_segmenter.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using Catch::Matchers::WithinAbs;

namespace {

constexpr uint32_t kRate = 16000;

std::vector<int16_t> silence(double seconds) {
    return std::vector<int16_t>(static_cast<size_t>(seconds * kRate), 0);
}

// Square wave well above the default energy threshold.
std::vector<int16_t> speech(double seconds) {
    std::vector<int16_t> v(static_cast<size_t>(seconds * kRate));
    for (size_t i = 0; i < v.size(); ++i) v[i] = (i / 20) % 2 ? 8000 : -8000;
    return v;
}

std::vector<int16_t> concat(std::initializer_list<std::vector<int16_t>> parts) {
    std::vector<int16_t> out;
    for (auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

struct Collector {
    std::mutex m;
    std::vector<SpeechSegment> segments;

    VoiceSegmenter::SegmentSink sink() {
        return [this](SpeechSegment s) {
            std::lock_guard lock(m);
            segments.push_back(std::move(s));
        };
    }

    size_t size() {
        std::lock_guard lock(m);
        return segments.size();
    }
};

VoiceSegmenter make_segmenter(Collector& c, VadParams params = {}) {
    return VoiceSegmenter(params, std::make_unique<EnergyClassifier>(), c.sink());
}

} // namespace

TEST_CASE("VoiceSegmenter", "[vad]") {
    Collector out;

    SECTION("SpeechBetweenSilences") {
        // 5 s silence, 2 s speech, 3 s silence with 200 ms padding.
        auto seg = make_segmenter(out);
        seg.process(concat({silence(5.0), speech(2.0), silence(3.0)}));

        REQUIRE(out.segments.size() == 1);
        auto& s = out.segments[0];
        REQUIRE(s.sequence() == 0);
        REQUIRE(s.start_offset() == 76800);
        REQUIRE(s.length() == 38400);
        REQUIRE_THAT(s.start_s(), WithinAbs(4.8, 1e-9));
        REQUIRE_THAT(s.duration_s(), WithinAbs(2.4, 1e-9));
        REQUIRE(s.confidence() > 0.2f);
        REQUIRE(seg.state() == SegmenterState::Silence);
        REQUIRE(seg.samples_processed() == 10 * kRate);
    }

    SECTION("PaddingIsSilence") {
        auto seg = make_segmenter(out);
        seg.process(concat({silence(1.0), speech(1.0), silence(1.0)}));

        REQUIRE(out.segments.size() == 1);
        auto samples = out.segments[0].samples();
        // 200 ms pre-roll and trailing pad around the speech
        REQUIRE(samples.size() == 3200 + 16000 + 3200);
        REQUIRE(samples[0] == 0);
        REQUIRE(samples[3199] == 0);
        REQUIRE(samples[3200] != 0);
        REQUIRE(samples.back() == 0);
    }

    SECTION("ShortBurstDroppedAsNoise") {
        auto seg = make_segmenter(out);
        seg.process(concat({silence(1.0), speech(0.1), silence(1.0)}));
        REQUIRE(out.segments.empty());
        REQUIRE(seg.segments_emitted() == 0);
    }

    SECTION("SilenceOnlyEmitsNothing") {
        auto seg = make_segmenter(out);
        seg.process(silence(10.0));
        seg.flush();
        REQUIRE(out.segments.empty());
    }

    SECTION("ChunkingDoesNotChangeSegments") {
        auto seg = make_segmenter(out);
        auto audio = concat({silence(5.0), speech(2.0), silence(3.0)});
        std::span<const int16_t> all(audio);
        for (size_t i = 0; i < all.size(); i += 77) {
            seg.process(all.subspan(i, std::min<size_t>(77, all.size() - i)));
        }

        REQUIRE(out.segments.size() == 1);
        REQUIRE(out.segments[0].start_offset() == 76800);
        REQUIRE(out.segments[0].length() == 38400);
    }

    SECTION("ShortPauseDoesNotSplit") {
        auto seg = make_segmenter(out);
        seg.process(concat({silence(1.0), speech(1.0), silence(0.3), speech(1.0), silence(1.0)}));
        REQUIRE(out.segments.size() == 1);
        REQUIRE(out.segments[0].length() == 3200 + 16000 + 4800 + 16000 + 3200);
    }

    SECTION("TwoUtterances") {
        auto seg = make_segmenter(out);
        seg.process(concat({silence(1.0), speech(1.0), silence(1.0), speech(1.0), silence(1.0)}));

        REQUIRE(out.segments.size() == 2);
        REQUIRE(out.segments[0].sequence() == 0);
        REQUIRE(out.segments[1].sequence() == 1);
        REQUIRE(out.segments[1].start_offset() == 3 * kRate - 3200);
        REQUIRE(out.segments[0].start_offset() + out.segments[0].length() <=
                out.segments[1].start_offset());
    }

    SECTION("LongSpeechCutAtMaxLength") {
        VadParams p;
        p.max_segment_s = 1;
        auto seg = make_segmenter(out, p);
        seg.process(concat({silence(1.0), speech(2.5), silence(1.0)}));

        REQUIRE(out.segments.size() == 3);
        REQUIRE(out.segments[0].length() == kRate);
        REQUIRE(out.segments[1].length() == kRate);
        // Cuts are contiguous
        REQUIRE(out.segments[1].start_offset() ==
                out.segments[0].start_offset() + out.segments[0].length());
        REQUIRE(out.segments[2].start_offset() ==
                out.segments[1].start_offset() + out.segments[1].length());
        REQUIRE(out.segments[2].length() == 11200 + 3200);
    }

    SECTION("ShortTailAfterCutKept") {
        // 250 ms of speech left after the second cut, under min_speech_ms.
        VadParams p;
        p.max_segment_s = 1;
        auto seg = make_segmenter(out, p);
        seg.process(concat({silence(1.0), speech(2.05), silence(1.0)}));

        REQUIRE(out.segments.size() == 3);
        REQUIRE(out.segments[0].length() == kRate);
        REQUIRE(out.segments[1].length() == kRate);
        REQUIRE(out.segments[2].start_offset() ==
                out.segments[1].start_offset() + out.segments[1].length());
        // The last frame is half speech and still scores as speech.
        REQUIRE(out.segments[2].length() >= 4000 + 3200);
        REQUIRE(out.segments[2].length() <= 4320 + 3200);
    }

    SECTION("CutAtSpeechEndEmitsNoEmptyTail") {
        // Pre-roll plus 0.8 s of speech fills the first segment exactly.
        VadParams p;
        p.max_segment_s = 1;
        auto seg = make_segmenter(out, p);
        seg.process(concat({silence(1.0), speech(0.8), silence(1.0)}));

        REQUIRE(out.segments.size() == 1);
        REQUIRE(out.segments[0].length() == kRate);
        REQUIRE(seg.state() == SegmenterState::Silence);
    }

    SECTION("FlushEmitsOpenCandidate") {
        auto seg = make_segmenter(out);
        seg.process(concat({silence(1.0), speech(1.0)}));
        REQUIRE(out.segments.empty());
        REQUIRE(seg.state() == SegmenterState::SpeechAccumulating);

        seg.flush();
        REQUIRE(out.segments.size() == 1);
        REQUIRE(out.segments[0].length() == 3200 + 16000);
        REQUIRE(seg.state() == SegmenterState::Silence);
    }

    SECTION("FlushDropsTooShortCandidate") {
        auto seg = make_segmenter(out);
        seg.process(concat({silence(1.0), speech(0.1)}));
        seg.flush();
        REQUIRE(out.segments.empty());
    }

    SECTION("ResetDiscardsAndRestartsNumbering") {
        auto seg = make_segmenter(out);
        seg.process(concat({silence(1.0), speech(1.0), silence(1.0)}));
        seg.process(speech(0.5));
        seg.reset();

        REQUIRE(seg.state() == SegmenterState::Silence);
        REQUIRE(seg.samples_processed() == 0);
        REQUIRE(out.segments.size() == 1);

        seg.process(concat({speech(1.0), silence(1.0)}));
        REQUIRE(out.segments.size() == 2);
        REQUIRE(out.segments[1].sequence() == 0);
        REQUIRE(out.segments[1].start_offset() == 0);
    }

    SECTION("InvalidParameters") {
        VadParams p;
        p.frame_ms = 0;
        REQUIRE_THROWS_AS(make_segmenter(out, p), std::invalid_argument);
        REQUIRE_THROWS_AS(VoiceSegmenter({}, nullptr, out.sink()), std::invalid_argument);
    }
}

TEST_CASE("SpeechSegment", "[vad]") {
    SpeechSegment s(3, std::vector<int16_t>(1600, 42), 8000, kRate, 0.5f);
    REQUIRE(s.sequence() == 3);
    REQUIRE_THAT(s.start_s(), WithinAbs(0.5, 1e-9));
    REQUIRE_THAT(s.duration_s(), WithinAbs(0.1, 1e-9));

    SECTION("WipeKeepsMetadata") {
        s.wipe();
        REQUIRE(s.empty());
        REQUIRE(s.length() == 1600);
        REQUIRE_THAT(s.duration_s(), WithinAbs(0.1, 1e-9));
    }

    SECTION("MoveLeavesSourceEmpty") {
        SpeechSegment moved = std::move(s);
        REQUIRE(moved.samples().size() == 1600);
        REQUIRE(s.empty());
    }
}

TEST_CASE("SegmenterWorker", "[vad]") {
    StreamingAudioBuffer buffer(10 * kRate);
    Collector out;
    VoiceSegmenter seg({}, std::make_unique<EnergyClassifier>(), out.sink());
    SegmenterWorker worker(buffer, seg, std::chrono::milliseconds(5));

    worker.start();
    REQUIRE(worker.running());

    auto wait_for = [&](size_t n) {
        for (int i = 0; i < 400 && out.size() < n; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return out.size() >= n;
    };

    SECTION("SegmentsFromBuffer") {
        buffer.write(concat({silence(1.0), speech(1.0), silence(1.0)}));
        REQUIRE(wait_for(1));
        worker.stop();
        REQUIRE_FALSE(worker.running());
        REQUIRE(out.segments[0].length() == 3200 + 16000 + 3200);
    }

    SECTION("FlushRequestClosesCandidate") {
        buffer.write(concat({silence(1.0), speech(1.0)}));
        for (int i = 0; i < 400 && buffer.used() > 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        worker.request_flush();
        REQUIRE(wait_for(1));
        worker.stop();
        REQUIRE(out.segments[0].length() == 3200 + 16000);
    }

    SECTION("FinishDrainsAndFlushes") {
        buffer.write(concat({silence(1.0), speech(1.0)}));
        worker.finish();

        REQUIRE_FALSE(worker.running());
        REQUIRE(buffer.used() == 0);
        REQUIRE(out.size() == 1);
        REQUIRE(out.segments[0].length() == 3200 + 16000);

        worker.finish();
        REQUIRE(out.size() == 1);
    }
}
