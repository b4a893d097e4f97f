#include "platform/linux/linux_event_loop.hpp"

#include "log.hpp"
#include "platform/linux/curl_transport.hpp"
#include "platform/platform_paths.hpp"
#include "transcription/remote_backend.hpp"
#include "transcription/whisper_local_backend.hpp"

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, std::string config_path)
    : config_(std::move(config)),
      buffer_(config_.audio.buffer_samples()),
      audio_capture_(buffer_, config_.audio.sample_rate, config_.audio.device),
      guard_({}, std::make_unique<CurlTransport>()),
      core_(config_, std::move(config_path), buffer_, audio_capture_, guard_, ipc_server_,
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    logging::error("daemon", std::string("eventfd write: ") + std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

std::vector<std::shared_ptr<TranscriptionBackend>> LinuxEventLoop::make_backends() {
    std::vector<std::shared_ptr<TranscriptionBackend>> backends;

    auto local = std::make_shared<WhisperLocalBackend>(config_.backend.threads);
    if (!config_.backend.model_path.empty()) {
        if (auto r = local->load_model(config_.backend.model_path); !r) {
            logging::error("whisper", r.error());
        } else {
            logging::info("Loaded model " + config_.backend.model_path);
        }
    } else {
        logging::info("No model_path configured, local backend unavailable");
    }
    backends.push_back(std::move(local));

    if (!config_.backend.remote_url.empty()) {
        backends.push_back(std::make_shared<RemoteBackend>(
            config_.backend.remote_url, config_.backend.remote_format, config_.backend.remote_model));
    }
    return backends;
}

bool LinuxEventLoop::init() {
    // Worker notification eventfd; pipeline threads may post as soon as core_ is live.
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        logging::error("daemon", std::string("eventfd failed: ") + std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    logging::info("IPC listening on " + ipc_path);

    // Core init (backends, audit store)
    if (!core_.init(make_backends())) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        logging::error("daemon", std::string("epoll_create1 failed: ") + std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        logging::error("daemon", std::string("signalfd failed: ") + std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            logging::error("daemon", std::string("epoll_ctl failed: ") + std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            logging::error("daemon", std::string("epoll_wait error: ") + std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    logging::info("Received signal " + std::to_string(info.ssi_signo) + ", shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                while (::read(worker_event_fd_, &val, sizeof(val)) == sizeof(val)) {}
                core_.process_posted();
                continue;
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (const auto& cmd : cmds) {
        if (auto response = core_.handle_command(fd, cmd)) {
            ipc_server_.send_response(fd, *response);
        }
    }

    if (!open) drop_client(fd);
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}
