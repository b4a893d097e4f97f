#pragma once

#include "audio_buffer.hpp"
#include "platform/audio_capture.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <pipewire/extensions/metadata.h>
#include <pipewire/pipewire.h>
#include <string>
#include <vector>

class PipeWireCapture : public AudioCapture {
public:
    // preferred_device: node.name to use instead of the system default (empty: follow default).
    PipeWireCapture(StreamingAudioBuffer& buffer, uint32_t sample_rate = 16000,
                    std::string preferred_device = {});
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    void set_listener(CaptureListener* listener) override;
    std::optional<DeviceHandle> default_device() override;
    std::vector<DeviceHandle> list_devices() override;
    void set_preferred_device(std::string name) override;
    std::expected<void, std::string> open(const DeviceHandle& device) override;
    void close() override;
    bool is_capturing() const override {
        return capturing_.load(std::memory_order_acquire) && !failed_.load(std::memory_order_acquire);
    }
    float level() const override { return level_.load(std::memory_order_relaxed); }

private:
    struct SourceNode {
        std::string name;
        std::string description;
    };

    bool connect_core();
    bool roundtrip();
    void destroy_stream();
    void report_failure(const std::string& reason);
    DeviceHandle make_handle(uint32_t id, const SourceNode& node) const;
    std::string preferred_device() const;

    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);
    static void on_core_done(void* userdata, uint32_t id, int seq);
    static void on_core_error(void* userdata, uint32_t id, int seq, int res, const char* message);
    static void on_registry_global(void* userdata, uint32_t id, uint32_t permissions,
                                   const char* type, uint32_t version, const spa_dict* props);
    static void on_registry_global_remove(void* userdata, uint32_t id);
    static int on_metadata_property(void* userdata, uint32_t subject, const char* key,
                                    const char* type, const char* value);

    StreamingAudioBuffer& buffer_;
    uint32_t sample_rate_;

    mutable std::mutex preferred_mutex_;
    std::string preferred_device_;

    std::atomic<CaptureListener*> listener_{nullptr};
    std::atomic<bool> capturing_{false};
    std::atomic<bool> failed_{false};
    std::atomic<float> level_{0.0f};

    pw_thread_loop* loop_ = nullptr;
    pw_context* context_ = nullptr;
    pw_core* core_ = nullptr;
    pw_registry* registry_ = nullptr;
    pw_metadata* metadata_ = nullptr;
    pw_stream* stream_ = nullptr;

    spa_hook core_listener_{};
    spa_hook registry_listener_{};
    spa_hook metadata_listener_{};
    spa_hook stream_listener_{};

    // Guarded by the thread-loop lock.
    std::map<uint32_t, SourceNode> sources_;
    std::string default_source_;
    std::string opened_default_;
    uint32_t bound_node_ = 0;
    int pending_seq_ = 0;
    bool synced_ = false;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };

    static constexpr pw_core_events core_events_ = {
        .version = PW_VERSION_CORE_EVENTS,
        .done = on_core_done,
        .error = on_core_error,
    };

    static constexpr pw_registry_events registry_events_ = {
        .version = PW_VERSION_REGISTRY_EVENTS,
        .global = on_registry_global,
        .global_remove = on_registry_global_remove,
    };

    static constexpr pw_metadata_events metadata_events_ = {
        .version = PW_VERSION_METADATA_EVENTS,
        .property = on_metadata_property,
    };
};
