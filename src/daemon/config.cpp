#include "config.hpp"

#include "log.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Reads a strictly positive integer field; zero or negative values are
// rejected and the default is kept.
void read_positive(const json& section, const char* key, uint32_t& out) {
    if (!section.contains(key)) return;
    auto v = section[key].get<int64_t>();
    if (v <= 0) {
        logging::error("config", std::string(key) + " must be positive, keeping " +
                                     std::to_string(out));
        return;
    }
    out = static_cast<uint32_t>(v);
}

void read_non_negative(const json& section, const char* key, uint32_t& out) {
    if (!section.contains(key)) return;
    auto v = section[key].get<int64_t>();
    if (v < 0) {
        logging::error("config", std::string(key) + " must not be negative, keeping " +
                                     std::to_string(out));
        return;
    }
    out = static_cast<uint32_t>(v);
}

void read_string(const json& section, const char* key, std::string& out) {
    if (section.contains(key)) out = section[key].get<std::string>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        logging::error("config", "could not open " + path + ", using defaults");
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_positive(a, "sample_rate", cfg.audio.sample_rate);
            read_positive(a, "buffer_seconds", cfg.audio.buffer_seconds);
            read_positive(a, "poll_ms", cfg.audio.poll_ms);
            read_string(a, "device", cfg.audio.device);
        }

        if (j.contains("vad")) {
            auto& v = j["vad"];
            if (v.contains("threshold")) {
                auto t = v["threshold"].get<float>();
                if (t < 0.0f || t > 1.0f) {
                    logging::error("config", "vad.threshold must be within [0, 1]");
                } else {
                    cfg.vad.threshold = t;
                }
            }
            read_positive(v, "frame_ms", cfg.vad.frame_ms);
            read_non_negative(v, "min_speech_ms", cfg.vad.min_speech_ms);
            read_positive(v, "min_silence_ms", cfg.vad.min_silence_ms);
            read_non_negative(v, "padding_ms", cfg.vad.padding_ms);
            read_positive(v, "max_segment_s", cfg.vad.max_segment_s);
        }

        if (j.contains("recovery")) {
            auto& r = j["recovery"];
            read_positive(r, "initial_delay_ms", cfg.recovery.initial_delay_ms);
            read_positive(r, "multiplier", cfg.recovery.multiplier);
            read_positive(r, "max_delay_ms", cfg.recovery.max_delay_ms);
            read_positive(r, "max_attempts", cfg.recovery.max_attempts);
            read_positive(r, "overrun_check_ms", cfg.recovery.overrun_check_ms);
            read_positive(r, "overrun_windows", cfg.recovery.overrun_windows);
        }

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read_string(b, "default", cfg.backend.default_id);
            read_string(b, "language", cfg.backend.language);
            read_string(b, "model_path", cfg.backend.model_path);
            read_non_negative(b, "threads", cfg.backend.threads);
            read_string(b, "remote_url", cfg.backend.remote_url);
            read_string(b, "remote_format", cfg.backend.remote_format);
            read_string(b, "remote_model", cfg.backend.remote_model);
        }

        if (j.contains("dispatcher")) {
            auto& d = j["dispatcher"];
            read_positive(d, "reorder_window", cfg.dispatcher.reorder_window);
            read_positive(d, "io_threads", cfg.dispatcher.io_threads);
            read_positive(d, "backpressure_timeout_ms", cfg.dispatcher.backpressure_timeout_ms);
            read_positive(d, "drain_timeout_ms", cfg.dispatcher.drain_timeout_ms);
        }

        if (j.contains("privacy")) {
            auto& p = j["privacy"];
            if (p.contains("allow_list")) {
                for (auto& e : p["allow_list"]) {
                    AllowEntry entry{
                        .category = e.value("category", ""),
                        .domain = e.value("domain", ""),
                    };
                    if (entry.category.empty() || entry.domain.empty()) {
                        logging::error("config", "allow_list entry needs category and domain");
                        continue;
                    }
                    cfg.privacy.allow_list.push_back(std::move(entry));
                }
            }
        }

        if (j.contains("audit")) {
            read_string(j["audit"], "path", cfg.audit_path);
        }

        if (j.contains("logging")) {
            cfg.verbose = j["logging"].value("verbose", cfg.verbose);
        }

    } catch (const json::exception& e) {
        logging::error("config", std::string("parse error: ") + e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
