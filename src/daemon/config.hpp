#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t buffer_seconds = 60;
        uint32_t poll_ms = 20;
        std::string device; // empty: system default source

        // Computed from buffer_seconds and sample_rate (no independent config key).
        size_t buffer_samples() const {
            return static_cast<size_t>(buffer_seconds) * sample_rate;
        }
    } audio;

    struct Vad {
        float threshold = 0.02f; // normalized RMS
        uint32_t frame_ms = 20;
        uint32_t min_speech_ms = 300;
        uint32_t min_silence_ms = 500;
        uint32_t padding_ms = 200;
        uint32_t max_segment_s = 30;
    } vad;

    struct Recovery {
        uint32_t initial_delay_ms = 500;
        uint32_t multiplier = 2;
        uint32_t max_delay_ms = 8000;
        uint32_t max_attempts = 3;
        uint32_t overrun_check_ms = 1000;
        uint32_t overrun_windows = 3;
    } recovery;

    struct Backend {
        std::string default_id = "local";
        std::string language = "en";
        std::string model_path;
        uint32_t threads = 0; // 0: hardware concurrency - 1
        std::string remote_url = "https://api.openai.com";
        std::string remote_format = "openai"; // "openai" or "whisper.cpp"
        std::string remote_model = "whisper-1";
    } backend;

    struct Dispatcher {
        uint32_t reorder_window = 8;
        uint32_t io_threads = 2;
        uint32_t backpressure_timeout_ms = 5000;
        uint32_t drain_timeout_ms = 10000; // stop: wait for submitted segments
    } dispatcher;

    struct AllowEntry {
        std::string category;
        std::string domain;
    };

    struct Privacy {
        // Opt-in destinations reachable while in local-only mode.
        std::vector<AllowEntry> allow_list;
    } privacy;

    std::string audit_path; // empty: <data dir>/audit.db
    bool verbose = false;

    static Config load(const std::string& path);
    static Config load_default();
};
