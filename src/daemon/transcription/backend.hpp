#pragma once

#include "errors.hpp"
#include "vad/speech_segment.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

class GuardedHttpClient;

struct BackendCapabilities {
    bool requires_network = false;
    std::vector<std::string> supported_languages; // empty: any
    bool supports_streaming = false;              // safe to call concurrently
};

struct TranscribeOptions {
    std::string language;
};

struct TranscriptResult {
    std::string text;
    bool is_final = true;
    std::string backend_id;
    std::chrono::milliseconds latency{0};
    double duration_s = 0.0;
    double processing_s = 0.0;
};

class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;

    virtual std::string id() const = 0;
    virtual BackendCapabilities capabilities() const = 0;
    virtual bool is_available() const = 0;

    virtual std::expected<TranscriptResult, PipelineError>
        transcribe(const SpeechSegment& segment, const TranscribeOptions& options) = 0;

    // Called once at registration for backends that require the network.
    virtual void install_network(std::shared_ptr<GuardedHttpClient> /*client*/) {}
};
