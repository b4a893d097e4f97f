#include "transcription/remote_backend.hpp"

#include "egress/egress_guard.hpp"
#include "wav_encoder.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

void wipe_payload(HttpRequest& request) {
    for (auto& field : request.form) {
        volatile char* p = field.data.data();
        for (size_t i = 0; i < field.data.size(); ++i) p[i] = 0;
        field.data.clear();
    }
}

} // namespace

RemoteBackend::RemoteBackend(std::string url, std::string api_format, std::string model,
                             std::string id)
    : url_(std::move(url)), api_format_(std::move(api_format)), model_(std::move(model)),
      id_(std::move(id)) {
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
}

BackendCapabilities RemoteBackend::capabilities() const {
    return {.requires_network = true, .supported_languages = {}, .supports_streaming = true};
}

bool RemoteBackend::is_available() const {
    std::lock_guard lock(mutex_);
    return client_ != nullptr;
}

void RemoteBackend::install_network(std::shared_ptr<GuardedHttpClient> client) {
    std::lock_guard lock(mutex_);
    client_ = std::move(client);
}

HttpRequest RemoteBackend::build_request(const SpeechSegment& segment,
                                         const TranscribeOptions& options) const {
    HttpRequest req;
    req.method = "POST";
    req.category = EgressCategory::Transcription;

    req.form.push_back({
        .name = "file",
        .data = wav::encode(segment.samples(), segment.sample_rate()),
        .filename = "audio.wav",
        .content_type = "audio/wav",
    });

    if (api_format_ == "openai") {
        req.url = url_ + "/v1/audio/transcriptions";
        req.form.push_back({.name = "model", .data = model_});
    } else {
        req.url = url_ + "/inference";
        req.form.push_back({.name = "temperature", .data = "0.0"});
    }
    req.form.push_back({.name = "response_format", .data = "json"});
    if (!options.language.empty()) {
        req.form.push_back({.name = "language", .data = options.language});
    }
    return req;
}

std::expected<TranscriptResult, PipelineError>
RemoteBackend::transcribe(const SpeechSegment& segment, const TranscribeOptions& options) {
    std::shared_ptr<GuardedHttpClient> client;
    {
        std::lock_guard lock(mutex_);
        client = client_;
    }
    if (!client) {
        return std::unexpected(PipelineError{ErrorCode::BackendUnavailable, "no network client"});
    }
    if (segment.empty()) {
        return std::unexpected(PipelineError{ErrorCode::TranscriptionFailed, "empty audio"});
    }

    auto start = std::chrono::steady_clock::now();
    auto req = build_request(segment, options);
    auto response = client->send(req);
    wipe_payload(req);
    auto end = std::chrono::steady_clock::now();

    if (!response) return std::unexpected(response.error());

    auto text = parse_response(*response);
    if (!text) return std::unexpected(text.error());

    return TranscriptResult{
        .text = std::move(*text),
        .is_final = true,
        .backend_id = id_,
        .duration_s = segment.duration_s(),
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}

std::expected<std::string, PipelineError> RemoteBackend::parse_response(const HttpResponse& response) {
    try {
        auto j = json::parse(response.body);

        if (j.contains("error")) {
            const auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>()
                                              : err.is_object() ? err.value("message", err.dump())
                                                                : err.dump();
            return std::unexpected(PipelineError{ErrorCode::TranscriptionFailed, "server error: " + msg});
        }
        if (response.status >= 400) {
            return std::unexpected(PipelineError{ErrorCode::TranscriptionFailed,
                                                 "HTTP " + std::to_string(response.status)});
        }
        if (j.contains("text") && j["text"].is_string()) {
            return trim(j["text"].get<std::string>());
        }
        return std::unexpected(PipelineError{ErrorCode::TranscriptionFailed,
                                             "unexpected response: " + response.body});
    } catch (const json::exception& e) {
        if (response.status >= 400) {
            return std::unexpected(PipelineError{ErrorCode::TranscriptionFailed,
                                                 "HTTP " + std::to_string(response.status)});
        }
        return std::unexpected(PipelineError{ErrorCode::TranscriptionFailed,
                                             std::string("JSON parse error: ") + e.what()});
    }
}
