#include "transcription/whisper_local_backend.hpp"

#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>
#include <whisper.h>

namespace {

void wipe(std::vector<float>& v) {
    volatile float* p = v.data();
    for (size_t i = 0; i < v.size(); ++i) p[i] = 0.0f;
}

} // namespace

WhisperLocalBackend::WhisperLocalBackend(uint32_t threads, std::string id)
    : id_(std::move(id)) {
    if (threads > 0) {
        threads_ = static_cast<int>(threads);
    } else {
        threads_ = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
    }
}

WhisperLocalBackend::~WhisperLocalBackend() {
    unload_model();
}

std::expected<void, std::string> WhisperLocalBackend::load_model(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected("model not found: " + path);
    }

    whisper_context_params params = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), params);
    if (!ctx) {
        return std::unexpected("failed to load model: " + path);
    }

    std::lock_guard lock(mutex_);
    if (ctx_) whisper_free(ctx_);
    ctx_ = ctx;
    loaded_.store(true, std::memory_order_release);
    logging::info("Loaded whisper model " + path + " (" + std::to_string(threads_) + " threads)");
    return {};
}

void WhisperLocalBackend::unload_model() {
    std::lock_guard lock(mutex_);
    loaded_.store(false, std::memory_order_release);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

BackendCapabilities WhisperLocalBackend::capabilities() const {
    return {
        .requires_network = false,
        .supported_languages = {"en", "fr", "de", "es", "it", "pt", "nl", "pl", "ru", "ja", "zh", "ko"},
        .supports_streaming = false,
    };
}

std::expected<TranscriptResult, PipelineError>
WhisperLocalBackend::transcribe(const SpeechSegment& segment, const TranscribeOptions& options) {
    if (segment.sample_rate() != WHISPER_SAMPLE_RATE) {
        return std::unexpected(PipelineError{
            ErrorCode::TranscriptionFailed,
            "expected " + std::to_string(WHISPER_SAMPLE_RATE) + " Hz audio, got " +
                std::to_string(segment.sample_rate())});
    }

    auto pcm = segment.samples();
    std::vector<float> samples(pcm.size());
    std::transform(pcm.begin(), pcm.end(), samples.begin(),
                   [](int16_t s) { return static_cast<float>(s) / 32768.0f; });

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = threads_;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.no_context = true;
    params.language = options.language.empty() ? "auto" : options.language.c_str();

    auto start = std::chrono::steady_clock::now();
    std::string text;
    {
        std::lock_guard lock(mutex_);
        if (!ctx_) {
            return std::unexpected(PipelineError{ErrorCode::BackendUnavailable, "no model loaded"});
        }

        int rc = whisper_full(ctx_, params, samples.data(), static_cast<int>(samples.size()));
        if (rc != 0) {
            wipe(samples);
            return std::unexpected(PipelineError{ErrorCode::TranscriptionFailed,
                                                 "whisper_full returned " + std::to_string(rc)});
        }

        int n = whisper_full_n_segments(ctx_);
        for (int i = 0; i < n; ++i) {
            if (const char* seg = whisper_full_get_segment_text(ctx_, i)) text += seg;
        }
    }
    wipe(samples);

    auto begin = text.find_first_not_of(" \t\n\r");
    text = begin == std::string::npos
        ? std::string()
        : text.substr(begin, text.find_last_not_of(" \t\n\r") - begin + 1);

    return TranscriptResult{
        .text = std::move(text),
        .is_final = true,
        .backend_id = id_,
        .duration_s = segment.duration_s(),
        .processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count(),
    };
}
