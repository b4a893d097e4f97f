#pragma once

#include "audio_buffer.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "egress/egress_guard.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, std::string config_path);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    std::vector<std::shared_ptr<TranscriptionBackend>> make_backends();
    void handle_client(int fd);
    void drop_client(int fd);

    Config config_;

    // Platform implementations (constructed before core_)
    StreamingAudioBuffer buffer_;
    PipeWireCapture audio_capture_;
    UnixSocketServer ipc_server_;
    EgressGuard guard_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
