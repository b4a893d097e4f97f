#include "platform/linux/pipewire_capture.hpp"

#include "audio_level.hpp"
#include "log.hpp"

#include <cstring>
#include <nlohmann/json.hpp>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

namespace {

// Holds the thread-loop lock for the current scope.
class LoopLock {
public:
    explicit LoopLock(pw_thread_loop* loop) : loop_(loop) { pw_thread_loop_lock(loop_); }
    ~LoopLock() { pw_thread_loop_unlock(loop_); }
    LoopLock(const LoopLock&) = delete;
    LoopLock& operator=(const LoopLock&) = delete;

private:
    pw_thread_loop* loop_;
};

constexpr const char* kDefaultSourceKey = "default.audio.source";

} // namespace

PipeWireCapture::PipeWireCapture(StreamingAudioBuffer& buffer, uint32_t sample_rate,
                                 std::string preferred_device)
    : buffer_(buffer), sample_rate_(sample_rate),
      preferred_device_(std::move(preferred_device)) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    close();

    if (loop_) {
        {
            LoopLock lock(loop_);
            if (metadata_) {
                spa_hook_remove(&metadata_listener_);
                pw_proxy_destroy(reinterpret_cast<pw_proxy*>(metadata_));
                metadata_ = nullptr;
            }
            if (registry_) {
                spa_hook_remove(&registry_listener_);
                pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry_));
                registry_ = nullptr;
            }
            if (core_) {
                spa_hook_remove(&core_listener_);
                pw_core_disconnect(core_);
                core_ = nullptr;
            }
        }
        pw_thread_loop_stop(loop_);
        if (context_) pw_context_destroy(context_);
        pw_thread_loop_destroy(loop_);
        context_ = nullptr;
        loop_ = nullptr;
    }
    pw_deinit();
}

void PipeWireCapture::set_listener(CaptureListener* listener) {
    listener_.store(listener, std::memory_order_release);
}

bool PipeWireCapture::connect_core() {
    if (core_) return true;

    if (!loop_) {
        loop_ = pw_thread_loop_new("localscribe", nullptr);
        if (!loop_) {
            logging::error("audio", "failed to create thread loop");
            return false;
        }
        context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
        if (!context_) {
            logging::error("audio", "failed to create context");
            pw_thread_loop_destroy(loop_);
            loop_ = nullptr;
            return false;
        }
        int ret = pw_thread_loop_start(loop_);
        if (ret < 0) {
            logging::error("audio", std::string("thread loop start failed: ") + spa_strerror(ret));
            pw_context_destroy(context_);
            context_ = nullptr;
            pw_thread_loop_destroy(loop_);
            loop_ = nullptr;
            return false;
        }
    }

    LoopLock lock(loop_);
    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_) {
        logging::error("audio", std::string("cannot connect to PipeWire: ") + std::strerror(errno));
        return false;
    }
    pw_core_add_listener(core_, &core_listener_, &core_events_, this);

    registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
    pw_registry_add_listener(registry_, &registry_listener_, &registry_events_, this);

    // First roundtrip delivers the registry globals, the second the
    // properties of the bound default metadata.
    return roundtrip() && roundtrip();
}

bool PipeWireCapture::roundtrip() {
    synced_ = false;
    pending_seq_ = pw_core_sync(core_, PW_ID_CORE, pending_seq_);
    while (!synced_) {
        if (pw_thread_loop_timed_wait(loop_, 2) != 0) {
            logging::error("audio", "PipeWire roundtrip timed out");
            return false;
        }
    }
    return true;
}

std::optional<DeviceHandle> PipeWireCapture::default_device() {
    if (!connect_core()) return std::nullopt;

    LoopLock lock(loop_);
    if (!roundtrip()) return std::nullopt;
    if (sources_.empty()) return std::nullopt;

    auto pick = [this](const std::string& name) -> const std::pair<const uint32_t, SourceNode>* {
        if (name.empty()) return nullptr;
        for (auto& entry : sources_) {
            if (entry.second.name == name) return &entry;
        }
        return nullptr;
    };

    const auto* chosen = pick(preferred_device());
    if (!chosen) chosen = pick(default_source_);
    if (!chosen) chosen = &*sources_.begin();

    return make_handle(chosen->first, chosen->second);
}

std::vector<DeviceHandle> PipeWireCapture::list_devices() {
    std::vector<DeviceHandle> devices;
    if (!connect_core()) return devices;

    LoopLock lock(loop_);
    if (!roundtrip()) return devices;
    for (const auto& [id, node] : sources_) {
        devices.push_back(make_handle(id, node));
    }
    return devices;
}

void PipeWireCapture::set_preferred_device(std::string name) {
    std::lock_guard lock(preferred_mutex_);
    preferred_device_ = std::move(name);
}

std::string PipeWireCapture::preferred_device() const {
    std::lock_guard lock(preferred_mutex_);
    return preferred_device_;
}

DeviceHandle PipeWireCapture::make_handle(uint32_t id, const SourceNode& node) const {
    return DeviceHandle{
        .id = id,
        .name = node.name,
        .description = node.description,
        .sample_rate = sample_rate_,
        .channels = 1,
        .format = SampleFormat::S16LE,
        .is_default = !default_source_.empty() && node.name == default_source_,
    };
}

std::expected<void, std::string> PipeWireCapture::open(const DeviceHandle& device) {
    if (!connect_core()) return std::unexpected("PipeWire unavailable");

    LoopLock lock(loop_);
    destroy_stream();

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "localscribe",
        PW_KEY_APP_NAME, "localscribe",
        PW_KEY_TARGET_OBJECT, device.name.c_str(),
        nullptr
    );

    stream_ = pw_stream_new(core_, "localscribe-capture", props);
    if (!stream_) {
        return std::unexpected("failed to create stream");
    }
    pw_stream_add_listener(stream_, &stream_listener_, &stream_events_, this);

    // S16_LE mono at the pipeline rate; PipeWire converts from the device format.
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    failed_.store(false, std::memory_order_release);
    capturing_.store(true, std::memory_order_release);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        destroy_stream();
        return std::unexpected(std::string("stream connect failed: ") + spa_strerror(ret));
    }

    bound_node_ = device.id;
    opened_default_ = default_source_;
    return {};
}

void PipeWireCapture::close() {
    capturing_.store(false, std::memory_order_release);
    if (!loop_) return;

    LoopLock lock(loop_);
    destroy_stream();
    bound_node_ = 0;
    level_.store(0.0f, std::memory_order_relaxed);
}

void PipeWireCapture::destroy_stream() {
    if (stream_) {
        spa_hook_remove(&stream_listener_);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
}

void PipeWireCapture::report_failure(const std::string& reason) {
    if (!capturing_.load(std::memory_order_acquire)) return;
    if (failed_.exchange(true, std::memory_order_acq_rel)) return;

    if (auto* l = listener_.load(std::memory_order_acquire)) {
        l->on_stream_failed(reason);
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data || !d->chunk) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    size_t count = d->chunk->size / sizeof(int16_t);
    std::span<const int16_t> samples(reinterpret_cast<const int16_t*>(data), count);

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->buffer_.write(samples);
        self->level_.store(audio::rms_level(samples), std::memory_order_relaxed);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    if (state == PW_STREAM_STATE_ERROR) {
        self->report_failure(error ? error : "stream error");
    } else if (state == PW_STREAM_STATE_UNCONNECTED && old != PW_STREAM_STATE_UNCONNECTED) {
        self->report_failure("stream disconnected");
    }
}

void PipeWireCapture::on_core_done(void* userdata, uint32_t id, int seq) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (id == PW_ID_CORE && seq == self->pending_seq_) {
        self->synced_ = true;
        pw_thread_loop_signal(self->loop_, false);
    }
}

void PipeWireCapture::on_core_error(void* userdata, uint32_t id, int /*seq*/, int res,
                                    const char* message) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    logging::error("audio", std::string("core error: ") + (message ? message : spa_strerror(res)));

    // The daemon connection itself died; the stream goes with it.
    if (id == PW_ID_CORE && res == -EPIPE) {
        self->report_failure("PipeWire connection lost");
    }
}

void PipeWireCapture::on_registry_global(void* userdata, uint32_t id, uint32_t /*permissions*/,
                                         const char* type, uint32_t /*version*/,
                                         const spa_dict* props) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (!props) return;

    if (std::strcmp(type, PW_TYPE_INTERFACE_Node) == 0) {
        const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
        if (!media_class || std::strcmp(media_class, "Audio/Source") != 0) return;

        const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
        const char* desc = spa_dict_lookup(props, PW_KEY_NODE_DESCRIPTION);
        self->sources_[id] = SourceNode{
            .name = name ? name : "",
            .description = desc ? desc : "",
        };
        return;
    }

    if (std::strcmp(type, PW_TYPE_INTERFACE_Metadata) == 0 && !self->metadata_) {
        const char* meta_name = spa_dict_lookup(props, PW_KEY_METADATA_NAME);
        if (!meta_name || std::strcmp(meta_name, "default") != 0) return;

        self->metadata_ = static_cast<pw_metadata*>(
            pw_registry_bind(self->registry_, id, type, PW_VERSION_METADATA, 0));
        if (self->metadata_) {
            pw_metadata_add_listener(self->metadata_, &self->metadata_listener_,
                                     &metadata_events_, self);
        }
    }
}

void PipeWireCapture::on_registry_global_remove(void* userdata, uint32_t id) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    self->sources_.erase(id);

    if (id == self->bound_node_) {
        self->report_failure("input device removed");
    }
}

int PipeWireCapture::on_metadata_property(void* userdata, uint32_t /*subject*/, const char* key,
                                          const char* /*type*/, const char* value) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (!key || std::strcmp(key, kDefaultSourceKey) != 0) return 0;

    // Value is JSON: {"name": "<node.name>"}
    std::string name;
    if (value) {
        auto j = nlohmann::json::parse(value, nullptr, false);
        if (!j.is_discarded() && j.is_object()) name = j.value("name", "");
    }

    bool changed = name != self->default_source_;
    self->default_source_ = name;

    // A pinned device does not follow the system default.
    if (changed && self->preferred_device().empty() && self->bound_node_ != 0 &&
        name != self->opened_default_ && !self->failed_.load(std::memory_order_acquire) &&
        self->capturing_.load(std::memory_order_acquire)) {
        self->failed_.store(true, std::memory_order_release);
        if (auto* l = self->listener_.load(std::memory_order_acquire)) {
            l->on_default_device_changed();
        }
    }
    return 0;
}
