#pragma once

#include "audio_buffer.hpp"
#include "vad/speech_classifier.hpp"
#include "vad/speech_segment.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <thread>
#include <vector>

struct VadParams {
    uint32_t sample_rate = 16000;
    float threshold = 0.02f;
    uint32_t frame_ms = 20;
    uint32_t min_speech_ms = 300;
    uint32_t min_silence_ms = 500;
    uint32_t padding_ms = 200;
    uint32_t max_segment_s = 30;
};

enum class SegmenterState { Silence, SpeechAccumulating };

// Splits a sample stream into speech segments.
//
// Frames scoring at or above the threshold are speech. A candidate opens on
// the first speech frame (with up to padding_ms of pre-roll) and closes once
// min_silence_ms of trailing silence has accumulated, keeping padding_ms of
// that silence. Candidates with less than min_speech_ms of speech are dropped
// as noise. Continuous speech is cut every max_segment_s; the remainder after
// a cut is never treated as noise.
//
// Not thread-safe; driven by a single SegmenterWorker or by tests directly.
class VoiceSegmenter {
public:
    using SegmentSink = std::function<void(SpeechSegment)>;

    VoiceSegmenter(VadParams params, std::unique_ptr<SpeechClassifier> classifier, SegmentSink sink);

    void process(std::span<const int16_t> samples);

    // Emits the open candidate unless it is shorter than min_speech_ms.
    void flush();

    // Starts a new session: pending audio discarded, offsets and sequence numbers zeroed.
    void reset();

    SegmenterState state() const { return state_; }
    uint64_t samples_processed() const { return processed_; }
    uint64_t segments_emitted() const { return next_sequence_; }

private:
    void process_frame(std::span<const int16_t> frame);
    void open_candidate(std::span<const int16_t> frame, float score, uint64_t frame_start);
    void close_candidate();
    void discard_candidate();
    void push_preroll(std::span<const int16_t> frame);

    VadParams params_;
    std::unique_ptr<SpeechClassifier> classifier_;
    SegmentSink sink_;

    size_t frame_len_;
    size_t min_speech_;
    size_t min_silence_;
    size_t padding_;
    size_t max_len_;

    SegmenterState state_ = SegmenterState::Silence;
    std::vector<int16_t> pending_frame_;
    std::vector<int16_t> preroll_;
    std::vector<int16_t> candidate_;
    uint64_t candidate_start_ = 0;
    size_t voiced_ = 0;
    size_t speech_end_ = 0; // candidate_ index one past the last speech frame
    size_t silence_run_ = 0;
    double score_sum_ = 0.0;
    size_t score_frames_ = 0;
    bool continuation_ = false; // candidate follows a max-length cut

    uint64_t processed_ = 0;
    uint64_t next_sequence_ = 0;
};

// Pulls from the capture buffer every poll interval and feeds the segmenter
// on its own thread.
class SegmenterWorker {
public:
    SegmenterWorker(StreamingAudioBuffer& buffer, VoiceSegmenter& segmenter,
                    std::chrono::milliseconds poll);
    ~SegmenterWorker();

    SegmenterWorker(const SegmenterWorker&) = delete;
    SegmenterWorker& operator=(const SegmenterWorker&) = delete;

    void start();

    // Joins the worker. Samples not yet pulled stay in the buffer.
    void stop();

    // Joins the worker, then on the calling thread feeds what is buffered to
    // the segmenter and flushes the open candidate. No-op when not running.
    void finish();

    bool running() const { return worker_.joinable(); }

    // Drain what is buffered and close the open candidate on the next tick.
    void request_flush() { flush_requested_.store(true, std::memory_order_release); }

private:
    void run(std::stop_token st);
    void drain();

    StreamingAudioBuffer& buffer_;
    VoiceSegmenter& segmenter_;
    std::chrono::milliseconds poll_;
    std::vector<int16_t> scratch_;
    std::atomic<bool> flush_requested_{false};
    std::jthread worker_;
};
