#pragma once

#include "egress/http.hpp"
#include "transcription/backend.hpp"

#include <memory>
#include <mutex>
#include <string>

// Remote transcription server reached through the guarded client.
// api_format "openai": POST {url}/v1/audio/transcriptions
// api_format "whisper.cpp": POST {url}/inference
class RemoteBackend : public TranscriptionBackend {
public:
    RemoteBackend(std::string url, std::string api_format = "openai",
                  std::string model = "whisper-1", std::string id = "remote");

    std::string id() const override { return id_; }
    BackendCapabilities capabilities() const override;
    // False until a guarded client has been installed.
    bool is_available() const override;

    std::expected<TranscriptResult, PipelineError>
        transcribe(const SpeechSegment& segment, const TranscribeOptions& options) override;

    void install_network(std::shared_ptr<GuardedHttpClient> client) override;

    HttpRequest build_request(const SpeechSegment& segment, const TranscribeOptions& options) const;
    static std::expected<std::string, PipelineError> parse_response(const HttpResponse& response);

private:
    std::string url_;
    std::string api_format_;
    std::string model_;
    std::string id_;

    mutable std::mutex mutex_;
    std::shared_ptr<GuardedHttpClient> client_;
};
