#pragma once

#include "transcription/backend.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>

struct whisper_context;

// In-process whisper.cpp inference. Available only while a model is loaded.
class WhisperLocalBackend : public TranscriptionBackend {
public:
    // threads: 0 picks hardware concurrency - 1.
    explicit WhisperLocalBackend(uint32_t threads = 0, std::string id = "local");
    ~WhisperLocalBackend() override;

    WhisperLocalBackend(const WhisperLocalBackend&) = delete;
    WhisperLocalBackend& operator=(const WhisperLocalBackend&) = delete;

    std::expected<void, std::string> load_model(const std::string& path);
    void unload_model();

    std::string id() const override { return id_; }
    BackendCapabilities capabilities() const override;
    bool is_available() const override { return loaded_.load(std::memory_order_acquire); }

    std::expected<TranscriptResult, PipelineError>
        transcribe(const SpeechSegment& segment, const TranscribeOptions& options) override;

private:
    std::string id_;
    int threads_;

    std::mutex mutex_; // whisper_full mutates the context
    whisper_context* ctx_ = nullptr;
    std::atomic<bool> loaded_{false};
};
