#include "vad/voice_segmenter.hpp"

#include "log.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

namespace {

size_t ms_to_samples(uint32_t ms, uint32_t rate) {
    return static_cast<size_t>(ms) * rate / 1000;
}

void wipe_range(std::vector<int16_t>& v, size_t from) {
    volatile int16_t* p = v.data();
    for (size_t i = from; i < v.size(); ++i) p[i] = 0;
    v.resize(from);
}

} // namespace

VoiceSegmenter::VoiceSegmenter(VadParams params, std::unique_ptr<SpeechClassifier> classifier,
                               SegmentSink sink)
    : params_(params), classifier_(std::move(classifier)), sink_(std::move(sink)) {
    if (params_.sample_rate == 0 || params_.frame_ms == 0) {
        throw std::invalid_argument("segmenter needs a positive sample rate and frame size");
    }
    if (!classifier_) {
        throw std::invalid_argument("segmenter needs a classifier");
    }

    frame_len_ = std::max<size_t>(1, ms_to_samples(params_.frame_ms, params_.sample_rate));
    min_speech_ = ms_to_samples(params_.min_speech_ms, params_.sample_rate);
    min_silence_ = std::max(frame_len_, ms_to_samples(params_.min_silence_ms, params_.sample_rate));
    padding_ = ms_to_samples(params_.padding_ms, params_.sample_rate);
    max_len_ = std::max(frame_len_, static_cast<size_t>(params_.max_segment_s) * params_.sample_rate);

    pending_frame_.reserve(frame_len_);
}

void VoiceSegmenter::process(std::span<const int16_t> samples) {
    size_t i = 0;

    if (!pending_frame_.empty()) {
        size_t take = std::min(frame_len_ - pending_frame_.size(), samples.size());
        pending_frame_.insert(pending_frame_.end(), samples.begin(), samples.begin() + take);
        i = take;
        if (pending_frame_.size() < frame_len_) return;
        process_frame(pending_frame_);
        wipe_range(pending_frame_, 0);
    }

    while (samples.size() - i >= frame_len_) {
        process_frame(samples.subspan(i, frame_len_));
        i += frame_len_;
    }

    pending_frame_.insert(pending_frame_.end(), samples.begin() + i, samples.end());
}

void VoiceSegmenter::process_frame(std::span<const int16_t> frame) {
    float score = classifier_->score(frame);
    bool speech = score >= params_.threshold;
    uint64_t frame_start = processed_;
    processed_ += frame.size();

    if (state_ == SegmenterState::Silence) {
        if (speech) {
            open_candidate(frame, score, frame_start);
        } else {
            push_preroll(frame);
        }
        return;
    }

    candidate_.insert(candidate_.end(), frame.begin(), frame.end());
    if (speech) {
        voiced_ += frame.size();
        speech_end_ = candidate_.size();
        silence_run_ = 0;
        score_sum_ += score;
        ++score_frames_;
    } else {
        silence_run_ += frame.size();
        if (silence_run_ >= min_silence_) {
            close_candidate();
            return;
        }
    }

    if (candidate_.size() >= max_len_) {
        // Continuous speech: cut here and keep accumulating into a fresh candidate.
        speech_end_ = candidate_.size();
        close_candidate();
        state_ = SegmenterState::SpeechAccumulating;
        candidate_start_ = processed_;
        continuation_ = true;
    }
}

void VoiceSegmenter::open_candidate(std::span<const int16_t> frame, float score,
                                    uint64_t frame_start) {
    candidate_.assign(preroll_.begin(), preroll_.end());
    candidate_start_ = frame_start - preroll_.size();
    wipe_range(preroll_, 0);

    candidate_.insert(candidate_.end(), frame.begin(), frame.end());
    voiced_ = frame.size();
    speech_end_ = candidate_.size();
    silence_run_ = 0;
    score_sum_ = score;
    score_frames_ = 1;
    continuation_ = false;
    state_ = SegmenterState::SpeechAccumulating;
}

void VoiceSegmenter::close_candidate() {
    state_ = SegmenterState::Silence;

    // The tail of a cut utterance is kept however short it is.
    if (continuation_ ? voiced_ == 0 : voiced_ < min_speech_) {
        if (voiced_ > 0) {
            logging::info("Dropped " + std::to_string(voiced_) + " samples of speech as noise");
        }
        discard_candidate();
        return;
    }

    size_t end = std::min(candidate_.size(), speech_end_ + padding_);

    // Silence past the trailing pad becomes pre-roll for the next onset.
    push_preroll(std::span<const int16_t>(candidate_).subspan(end));
    wipe_range(candidate_, end);

    float confidence = score_frames_ ? static_cast<float>(score_sum_ / score_frames_) : 0.0f;
    SpeechSegment seg(next_sequence_++, std::move(candidate_), candidate_start_,
                      params_.sample_rate, std::min(confidence, 1.0f));
    candidate_ = {};
    voiced_ = 0;
    speech_end_ = 0;
    silence_run_ = 0;
    score_sum_ = 0.0;
    score_frames_ = 0;
    continuation_ = false;

    logging::info("Segment " + std::to_string(seg.sequence()) + ": " +
                  logging::fixed(seg.start_s(), 2) + "s +" + logging::fixed(seg.duration_s(), 2) + "s");
    if (sink_) sink_(std::move(seg));
}

void VoiceSegmenter::discard_candidate() {
    secure_wipe(candidate_);
    voiced_ = 0;
    speech_end_ = 0;
    silence_run_ = 0;
    score_sum_ = 0.0;
    score_frames_ = 0;
    continuation_ = false;
    state_ = SegmenterState::Silence;
}

void VoiceSegmenter::push_preroll(std::span<const int16_t> frame) {
    if (padding_ == 0) return;
    preroll_.insert(preroll_.end(), frame.begin(), frame.end());
    if (preroll_.size() > padding_) {
        preroll_.erase(preroll_.begin(), preroll_.end() - static_cast<std::ptrdiff_t>(padding_));
    }
}

void VoiceSegmenter::flush() {
    // A partial frame is too short to classify.
    wipe_range(pending_frame_, 0);

    if (state_ == SegmenterState::SpeechAccumulating) {
        close_candidate();
    }
    // Audio after a flush is not contiguous with what came before.
    wipe_range(preroll_, 0);
}

void VoiceSegmenter::reset() {
    wipe_range(pending_frame_, 0);
    wipe_range(preroll_, 0);
    discard_candidate();
    processed_ = 0;
    next_sequence_ = 0;
}

SegmenterWorker::SegmenterWorker(StreamingAudioBuffer& buffer, VoiceSegmenter& segmenter,
                                 std::chrono::milliseconds poll)
    : buffer_(buffer), segmenter_(segmenter), poll_(poll) {}

SegmenterWorker::~SegmenterWorker() {
    stop();
}

void SegmenterWorker::start() {
    if (worker_.joinable()) return;
    flush_requested_.store(false, std::memory_order_relaxed);
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void SegmenterWorker::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    worker_.join();
    worker_ = std::jthread();
    wipe_range(scratch_, 0);
}

void SegmenterWorker::finish() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    worker_.join();
    worker_ = std::jthread();

    drain();
    segmenter_.flush();
    wipe_range(scratch_, 0);
}

void SegmenterWorker::run(std::stop_token st) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);

    while (!st.stop_requested()) {
        drain();
        if (flush_requested_.exchange(false, std::memory_order_acq_rel)) {
            segmenter_.flush();
        }
        cv.wait_for(lock, st, poll_, [] { return false; });
    }
}

void SegmenterWorker::drain() {
    // Fixed-size chunks; loop until the buffer is empty.
    scratch_.resize(std::max<size_t>(buffer_.capacity() / 64, 1024));

    for (;;) {
        size_t n = buffer_.read(scratch_);
        if (n == 0) break;
        segmenter_.process(std::span<const int16_t>(scratch_).first(n));
    }
}
