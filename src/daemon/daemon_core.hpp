#pragma once

#include "audio_buffer.hpp"
#include "capture/capture_supervisor.hpp"
#include "config.hpp"
#include "egress/egress_guard.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "storage/audit_store.hpp"
#include "transcription/backend.hpp"
#include "transcription/dispatcher.hpp"
#include "vad/voice_segmenter.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Platform-independent daemon logic: owns the pipeline
// (supervisor -> buffer -> segmenter -> dispatcher) and answers IPC commands.
//
// Pipeline threads never touch IPC state; they post() work that the event
// loop runs through process_posted() after notify() wakes it.
class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, std::string config_path,
               StreamingAudioBuffer& buffer, AudioCapture& capture,
               EgressGuard& guard, IpcServer& ipc, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init(std::vector<std::shared_ptr<TranscriptionBackend>> backends);

    // nullopt: the reply is sent to client_fd later.
    std::optional<nlohmann::json> handle_command(int client_fd, const nlohmann::json& cmd);

    // Event-loop thread: run work posted by pipeline threads.
    void process_posted();

    void remove_client(int fd);

    CaptureState capture_state() const { return supervisor_.state(); }
    uint64_t session() const { return session_; }

    void shutdown();

private:
    nlohmann::json handle_start(int client_fd, bool& deferred);
    nlohmann::json handle_stop(int client_fd, bool& deferred);
    nlohmann::json handle_status();
    nlohmann::json handle_devices();
    nlohmann::json handle_select_device(const nlohmann::json& cmd);
    nlohmann::json handle_backends();
    nlohmann::json handle_select_backend(const nlohmann::json& cmd);
    nlohmann::json handle_privacy();
    nlohmann::json handle_consent_enable(const nlohmann::json& cmd);
    nlohmann::json handle_consent_credential(const nlohmann::json& cmd);
    nlohmann::json handle_consent_confirm(const nlohmann::json& cmd);
    nlohmann::json handle_consent_revoke();
    nlohmann::json handle_audit(const nlohmann::json& cmd);
    nlohmann::json handle_subscribe(int client_fd);

    void apply_session_config();

    // Control waiter thread: feed buffered audio through the segmenter and
    // wait for submitted segments to be delivered.
    void drain_session(uint64_t session);
    // Event-loop thread, after a drain.
    void close_session();
    void end_failed_session();
    void on_capture_event(const CaptureEvent& ev);
    void on_segment(SpeechSegment segment);
    void on_outcome(const DispatchOutcome& outcome);
    void on_egress(const EgressDecision& decision);

    void post(std::function<void()> task);
    void broadcast(const nlohmann::json& event);
    void reply(int client_fd, const nlohmann::json& response);

    Config config_;
    std::string config_path_;

    StreamingAudioBuffer& buffer_;
    AudioCapture& capture_;
    EgressGuard& guard_;
    IpcServer& ipc_;
    NotifyCallback notify_;

    AuditStore audit_;

    std::mutex posted_mutex_;
    std::deque<std::function<void()>> posted_;

    // Event-loop thread only
    std::vector<int> subscribers_;
    std::vector<int> waiting_clients_;
    uint64_t session_ = 0;
    bool control_busy_ = false;

    TranscriptionDispatcher dispatcher_;
    std::unique_ptr<VoiceSegmenter> segmenter_;
    std::unique_ptr<SegmenterWorker> segmenter_worker_;
    CaptureSupervisor supervisor_;

    // Waits on supervisor futures off the event-loop thread.
    std::jthread control_waiter_;
};
