#include "capture/capture_supervisor.hpp"

#include "log.hpp"

#include <algorithm>

const char* state_name(CaptureState state) {
    switch (state) {
        case CaptureState::Idle: return "idle";
        case CaptureState::Recording: return "recording";
        case CaptureState::DeviceLost: return "device_lost";
        case CaptureState::Recovering: return "recovering";
        case CaptureState::Error: return "error";
    }
    return "unknown";
}

CaptureSupervisor::CaptureSupervisor(StreamingAudioBuffer& buffer, AudioCapture& capture,
                                     RecoveryPolicy policy, EventSink sink)
    : buffer_(buffer), capture_(capture), policy_(policy), sink_(std::move(sink)) {
    capture_.set_listener(this);
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

CaptureSupervisor::~CaptureSupervisor() {
    worker_.request_stop();
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    capture_.close();
    capture_.set_listener(nullptr);
}

std::future<StartResult> CaptureSupervisor::start() {
    Command cmd{.type = Command::Type::Start};
    auto fut = cmd.start_reply.get_future();
    push(std::move(cmd));
    return fut;
}

std::future<void> CaptureSupervisor::stop() {
    Command cmd{.type = Command::Type::Stop};
    auto fut = cmd.stop_reply.get_future();
    push(std::move(cmd));
    return fut;
}

std::optional<DeviceHandle> CaptureSupervisor::device() const {
    std::lock_guard lock(device_mutex_);
    return device_;
}

void CaptureSupervisor::on_stream_failed(const std::string& reason) {
    mark_lost(reason);
}

void CaptureSupervisor::on_default_device_changed() {
    // Never keep reading from a stale handle: close and reopen against the
    // new default, exactly as for a failed stream.
    mark_lost("default input device changed");
}

void CaptureSupervisor::mark_lost(const std::string& reason) {
    auto expected = CaptureState::Recording;
    if (!state_.compare_exchange_strong(expected, CaptureState::DeviceLost,
                                        std::memory_order_acq_rel)) {
        return;
    }

    emit({.kind = CaptureEvent::Kind::StateChanged,
          .from = CaptureState::Recording,
          .to = CaptureState::DeviceLost,
          .reason = reason});

    push({.type = Command::Type::StreamLost, .reason = reason});
}

void CaptureSupervisor::push(Command cmd) {
    {
        std::lock_guard lock(mutex_);
        commands_.push_back(std::move(cmd));
    }
    cv_.notify_one();
}

void CaptureSupervisor::run(std::stop_token st) {
    std::unique_lock lock(mutex_);

    while (!st.stop_requested()) {
        if (commands_.empty()) {
            std::optional<Clock::time_point> deadline = retry_at_;
            if (state() == CaptureState::Recording) {
                deadline = deadline ? std::min(*deadline, overrun_check_at_) : overrun_check_at_;
            }

            auto ready = [this] { return !commands_.empty(); };
            if (deadline) {
                cv_.wait_until(lock, st, *deadline, ready);
            } else {
                cv_.wait(lock, st, ready);
            }
            if (st.stop_requested()) break;
        }

        if (!commands_.empty()) {
            Command cmd = std::move(commands_.front());
            commands_.pop_front();
            lock.unlock();

            switch (cmd.type) {
                case Command::Type::Start:
                    cmd.start_reply.set_value(handle_start());
                    break;
                case Command::Type::Stop:
                    handle_stop();
                    cmd.stop_reply.set_value();
                    break;
                case Command::Type::StreamLost:
                    handle_stream_lost(cmd.reason);
                    break;
            }

            lock.lock();
            continue;
        }

        auto now = Clock::now();
        lock.unlock();
        if (retry_at_ && now >= *retry_at_) {
            attempt_recovery();
        }
        if (state() == CaptureState::Recording && now >= overrun_check_at_) {
            check_overruns();
        }
        lock.lock();
    }
}

StartResult CaptureSupervisor::handle_start() {
    if (state() == CaptureState::Recording) {
        return std::unexpected(PipelineError{ErrorCode::InvalidState, "already recording"});
    }

    // An explicit start supersedes any pending or exhausted recovery.
    retry_at_.reset();
    attempts_.store(0, std::memory_order_relaxed);

    auto dev = open_default();
    if (!dev) {
        logging::error("audio", dev.error().describe());
        if (state() != CaptureState::Idle) transition(CaptureState::Idle);
        return std::unexpected(dev.error());
    }

    transition(CaptureState::Recording, 0, dev->description.empty() ? dev->name : dev->description);
    logging::info("Recording started on " + dev->name);
    confirm_stream();
    return {};
}

void CaptureSupervisor::handle_stop() {
    retry_at_.reset();
    attempts_.store(0, std::memory_order_relaxed);

    capture_.close();
    buffer_.reset();
    {
        std::lock_guard lock(device_mutex_);
        device_.reset();
    }

    if (state() != CaptureState::Idle) {
        transition(CaptureState::Idle);
        logging::info("Recording stopped");
    }
}

void CaptureSupervisor::handle_stream_lost(const std::string& reason) {
    // Stale notification: the session was stopped or restarted meanwhile.
    if (state() != CaptureState::DeviceLost) return;

    logging::error("audio", "stream lost: " + reason);

    capture_.close();
    {
        std::lock_guard lock(device_mutex_);
        device_.reset();
    }

    attempts_.store(0, std::memory_order_relaxed);
    last_error_ = reason;
    next_delay_ = policy_.initial_delay;
    retry_at_ = Clock::now() + next_delay_;
}

void CaptureSupervisor::attempt_recovery() {
    auto current = state();
    if (current != CaptureState::DeviceLost && current != CaptureState::Recovering) {
        retry_at_.reset();
        return;
    }

    uint32_t attempt = attempts_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (current == CaptureState::DeviceLost) {
        transition(CaptureState::Recovering, attempt, last_error_);
    }

    logging::info("Recovery attempt " + std::to_string(attempt) + "/" +
                  std::to_string(policy_.max_attempts));

    auto dev = open_default();
    if (dev) {
        retry_at_.reset();
        std::string name = dev->description.empty() ? dev->name : dev->description;
        transition(CaptureState::Recording, attempt, name);
        emit({.kind = CaptureEvent::Kind::RecoverySucceeded,
              .from = CaptureState::Recovering,
              .to = CaptureState::Recording,
              .attempt = attempt,
              .device = name});
        attempts_.store(0, std::memory_order_relaxed);
        logging::info("Recovered on " + name);
        confirm_stream();
        return;
    }

    last_error_ = dev.error().detail;
    logging::error("audio", "recovery attempt " + std::to_string(attempt) + " failed: " +
                                last_error_);

    if (attempt >= policy_.max_attempts) {
        retry_at_.reset();
        transition(CaptureState::Error, attempt, last_error_);
        emit({.kind = CaptureEvent::Kind::RecoveryExhausted,
              .from = CaptureState::Recovering,
              .to = CaptureState::Error,
              .attempt = attempt,
              .reason = last_error_});
        return;
    }

    next_delay_ = std::min(next_delay_ * policy_.multiplier, policy_.max_delay);
    retry_at_ = Clock::now() + next_delay_;
}

void CaptureSupervisor::confirm_stream() {
    // A failure reported between open() and the Recording transition found
    // the state not yet Recording and was ignored; re-raise it now.
    if (!capture_.is_capturing()) {
        mark_lost("stream failed while opening");
    }
}

void CaptureSupervisor::check_overruns() {
    overrun_check_at_ = Clock::now() + policy_.overrun_check;

    uint64_t dropped = buffer_.dropped();
    if (dropped > last_dropped_) {
        ++overrun_streak_;
    } else {
        overrun_streak_ = 0;
    }
    last_dropped_ = dropped;

    if (overrun_streak_ >= policy_.overrun_windows) {
        overrun_streak_ = 0;
        logging::error("audio", "sustained buffer overrun, " + std::to_string(dropped) +
                                    " samples dropped");
        emit({.kind = CaptureEvent::Kind::SustainedOverrun,
              .from = CaptureState::Recording,
              .to = CaptureState::Recording,
              .dropped = dropped});
    }
}

std::expected<DeviceHandle, PipelineError> CaptureSupervisor::open_default() {
    auto dev = capture_.default_device();
    if (!dev) {
        return std::unexpected(PipelineError{ErrorCode::DeviceUnavailable, "no input device"});
    }

    buffer_.reset();
    auto opened = capture_.open(*dev);
    if (!opened) {
        return std::unexpected(PipelineError{ErrorCode::DeviceUnavailable,
                                             dev->name + ": " + opened.error()});
    }

    {
        std::lock_guard lock(device_mutex_);
        device_ = *dev;
    }
    last_dropped_ = 0;
    overrun_streak_ = 0;
    overrun_check_at_ = Clock::now() + policy_.overrun_check;
    return *dev;
}

void CaptureSupervisor::transition(CaptureState to, uint32_t attempt, std::string reason) {
    auto from = state_.exchange(to, std::memory_order_acq_rel);
    CaptureEvent ev{.kind = CaptureEvent::Kind::StateChanged, .from = from, .to = to,
                    .attempt = attempt};
    if (to == CaptureState::Recording) {
        ev.device = std::move(reason);
    } else {
        ev.reason = std::move(reason);
    }
    emit(ev);
}

void CaptureSupervisor::emit(const CaptureEvent& ev) {
    if (sink_) sink_(ev);
}
