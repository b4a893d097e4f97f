#pragma once

#include "audio_buffer.hpp"
#include "capture/device.hpp"
#include "errors.hpp"
#include "platform/audio_capture.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class CaptureState : uint8_t { Idle, Recording, DeviceLost, Recovering, Error };

const char* state_name(CaptureState state);

struct CaptureEvent {
    enum class Kind { StateChanged, RecoverySucceeded, RecoveryExhausted, SustainedOverrun };

    Kind kind = Kind::StateChanged;
    CaptureState from = CaptureState::Idle;
    CaptureState to = CaptureState::Idle;
    uint32_t attempt = 0;
    std::string device;
    std::string reason;
    uint64_t dropped = 0;
};

struct RecoveryPolicy {
    std::chrono::milliseconds initial_delay{500};
    uint32_t multiplier = 2;
    std::chrono::milliseconds max_delay{8000};
    uint32_t max_attempts = 3;
    std::chrono::milliseconds overrun_check{1000};
    uint32_t overrun_windows = 3;
};

using StartResult = std::expected<void, PipelineError>;

// Owns the physical input stream and its recovery state machine:
//
//   Idle -> Recording            start()
//   Recording -> DeviceLost      stream failure or default-device change
//   DeviceLost -> Recovering     after initial_delay
//   Recovering -> Recording      reopen succeeded
//   Recovering -> Error          max_attempts consecutive failures
//   any -> Idle                  stop()
//
// Stream open/close and recovery waits run on an internal worker thread;
// start() and stop() only enqueue and hand back a future.
class CaptureSupervisor : public CaptureListener {
public:
    using EventSink = std::function<void(const CaptureEvent&)>;

    CaptureSupervisor(StreamingAudioBuffer& buffer, AudioCapture& capture,
                      RecoveryPolicy policy, EventSink sink);
    ~CaptureSupervisor() override;

    CaptureSupervisor(const CaptureSupervisor&) = delete;
    CaptureSupervisor& operator=(const CaptureSupervisor&) = delete;

    // Valid from any state except Recording. A failed start leaves the
    // supervisor Idle.
    std::future<StartResult> start();

    // Valid from any state; always ends in Idle with the device released and
    // unread samples discarded.
    std::future<void> stop();

    CaptureState state() const { return state_.load(std::memory_order_acquire); }
    uint32_t recovery_attempts() const { return attempts_.load(std::memory_order_relaxed); }
    std::optional<DeviceHandle> device() const;
    float level() const { return capture_.level(); }

    // CaptureListener (audio backend thread)
    void on_stream_failed(const std::string& reason) override;
    void on_default_device_changed() override;

private:
    struct Command {
        enum class Type { Start, Stop, StreamLost };
        Type type;
        std::promise<StartResult> start_reply;
        std::promise<void> stop_reply;
        std::string reason;
    };

    using Clock = std::chrono::steady_clock;

    void run(std::stop_token st);
    void push(Command cmd);

    StartResult handle_start();
    void handle_stop();
    void handle_stream_lost(const std::string& reason);
    void attempt_recovery();
    void check_overruns();
    void confirm_stream();

    std::expected<DeviceHandle, PipelineError> open_default();
    void transition(CaptureState to, uint32_t attempt = 0, std::string reason = {});
    void mark_lost(const std::string& reason);
    void emit(const CaptureEvent& ev);

    StreamingAudioBuffer& buffer_;
    AudioCapture& capture_;
    RecoveryPolicy policy_;
    EventSink sink_;

    std::atomic<CaptureState> state_{CaptureState::Idle};
    std::atomic<uint32_t> attempts_{0};

    // Worker-owned
    std::optional<Clock::time_point> retry_at_;
    std::chrono::milliseconds next_delay_{0};
    Clock::time_point overrun_check_at_;
    uint64_t last_dropped_ = 0;
    uint32_t overrun_streak_ = 0;
    std::string last_error_;

    mutable std::mutex device_mutex_;
    std::optional<DeviceHandle> device_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Command> commands_;

    std::jthread worker_;
};
