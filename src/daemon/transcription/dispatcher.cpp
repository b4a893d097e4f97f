#include "transcription/dispatcher.hpp"

#include "egress/egress_guard.hpp"
#include "log.hpp"

#include <algorithm>
#include <thread>

namespace {

size_t compute_threads(size_t requested) {
    if (requested > 0) return requested;
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

TranscriptionDispatcher::TranscriptionDispatcher(EgressGuard& guard, DispatcherOptions options,
                                                 DeliverySink sink)
    : guard_(guard), options_(options), sink_(std::move(sink)),
      compute_pool_(compute_threads(options.compute_threads)),
      io_pool_(std::max<size_t>(options.io_threads, 1)) {
    options_.reorder_window = std::max<size_t>(options_.reorder_window, 1);
}

TranscriptionDispatcher::~TranscriptionDispatcher() {
    end_session();
}

void TranscriptionDispatcher::register_backend(std::shared_ptr<TranscriptionBackend> backend) {
    if (!backend) return;

    // No backend gets a network path that bypasses the guard.
    if (backend->capabilities().requires_network) {
        backend->install_network(guard_.make_client());
    }

    std::lock_guard lock(mutex_);
    std::erase_if(backends_, [&](const auto& b) { return b->id() == backend->id(); });
    if (!active_) active_ = backend;
    backends_.push_back(std::move(backend));
}

std::expected<void, PipelineError> TranscriptionDispatcher::select_backend(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find_if(backends_, [&](const auto& b) { return b->id() == id; });
    if (it == backends_.end()) {
        return std::unexpected(PipelineError{ErrorCode::BackendUnavailable, "unknown backend '" + id + "'"});
    }
    active_ = *it;
    logging::info("Active backend: " + id);
    return {};
}

std::string TranscriptionDispatcher::active_backend_id() const {
    std::lock_guard lock(mutex_);
    return active_ ? active_->id() : std::string();
}

std::shared_ptr<TranscriptionBackend> TranscriptionDispatcher::find_backend(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find_if(backends_, [&](const auto& b) { return b->id() == id; });
    return it != backends_.end() ? *it : nullptr;
}

std::vector<std::shared_ptr<TranscriptionBackend>> TranscriptionDispatcher::backends() const {
    std::lock_guard lock(mutex_);
    return backends_;
}

void TranscriptionDispatcher::set_options(TranscribeOptions options) {
    std::lock_guard lock(mutex_);
    transcribe_options_ = std::move(options);
}

uint64_t TranscriptionDispatcher::begin_session() {
    uint64_t id;
    {
        std::lock_guard lock(mutex_);
        cancel_session();
        id = ++last_session_;
        live_session_.store(id, std::memory_order_release);
    }
    // Wait out any delivery of the previous session still in progress.
    std::lock_guard barrier(delivery_mutex_);
    return id;
}

void TranscriptionDispatcher::end_session() {
    {
        std::lock_guard lock(mutex_);
        cancel_session();
    }
    std::lock_guard barrier(delivery_mutex_);
}

void TranscriptionDispatcher::cancel_session() {
    if (live_session_.load(std::memory_order_relaxed) == 0) return;

    if (!queued_.empty() || !slots_.empty()) {
        logging::info("Session ended: " + std::to_string(queued_.size()) + " queued cancelled, " +
                      std::to_string(running_) + " running discarded");
    }

    live_session_.store(0, std::memory_order_release);
    queued_.clear(); // segment destructors wipe the audio
    slots_.clear();
    completed_.clear();
    next_index_ = 0;
    next_deliver_ = 0;
    cv_.notify_all();
}

bool TranscriptionDispatcher::session_active() const {
    return live_session_.load(std::memory_order_acquire) != 0;
}

std::expected<void, PipelineError> TranscriptionDispatcher::submit(SpeechSegment segment) {
    auto seg = std::make_shared<SpeechSegment>(std::move(segment));

    std::unique_lock lock(mutex_);
    uint64_t session = live_session_.load(std::memory_order_relaxed);
    if (session == 0) {
        return std::unexpected(PipelineError{ErrorCode::InvalidState, "no active session"});
    }

    bool has_room = cv_.wait_for(lock, options_.backpressure_timeout, [&] {
        return live_session_.load(std::memory_order_relaxed) != session ||
               next_index_ - next_deliver_ < options_.reorder_window;
    });

    if (live_session_.load(std::memory_order_relaxed) != session) {
        return std::unexpected(PipelineError{ErrorCode::InvalidState, "session ended"});
    }
    if (!has_room) {
        logging::error("dispatch", "reorder window full, segment " + std::to_string(seg->sequence()) +
                                       " rejected");
        return std::unexpected(PipelineError{
            ErrorCode::Backpressure,
            std::to_string(next_index_ - next_deliver_) + " results undelivered"});
    }

    // Bound here: a later select_backend() does not affect this request.
    auto backend = active_;
    if (!backend) {
        return std::unexpected(PipelineError{ErrorCode::BackendUnavailable, "no backend selected"});
    }
    if (!backend->is_available()) {
        return std::unexpected(PipelineError{ErrorCode::BackendUnavailable,
                                             backend->id() + " is not available"});
    }

    auto caps = backend->capabilities();
    uint64_t index = next_index_++;
    slots_.emplace(index, DispatchOutcome{
        .session = session,
        .index = index,
        .segment = seg->sequence(),
        .start_s = seg->start_s(),
        .duration_s = seg->duration_s(),
        .result = TranscriptResult{},
    });

    queued_.push_back(Task{
        .session = session,
        .index = index,
        .backend = std::move(backend),
        .streaming = caps.supports_streaming,
        .remote = caps.requires_network,
        .segment = std::move(seg),
        .options = transcribe_options_,
    });
    pump();
    return {};
}

void TranscriptionDispatcher::pump() {
    while (!queued_.empty() && !running_exclusive_) {
        const Task& head = queued_.front();
        bool can_start = head.streaming ? running_ < options_.reorder_window : running_ == 0;
        if (!can_start) break;

        Task task = std::move(queued_.front());
        queued_.pop_front();
        ++running_;
        if (!task.streaming) running_exclusive_ = true;

        auto& pool = task.remote ? io_pool_ : compute_pool_;
        pool.post([this, task = std::move(task)] { execute(task); });
    }
}

void TranscriptionDispatcher::execute(const Task& task) {
    if (live_session_.load(std::memory_order_acquire) != task.session) {
        task.segment->wipe();
        complete(task, std::unexpected(PipelineError{ErrorCode::InvalidState, "session ended"}));
        return;
    }

    auto start = std::chrono::steady_clock::now();
    auto result = task.backend->transcribe(*task.segment, task.options);
    auto elapsed = std::chrono::steady_clock::now() - start;
    double duration_s = task.segment->duration_s();
    task.segment->wipe();

    if (result) {
        result->backend_id = task.backend->id();
        result->latency = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
        if (result->duration_s == 0.0) result->duration_s = duration_s;
        if (result->processing_s == 0.0) {
            result->processing_s = std::chrono::duration<double>(elapsed).count();
        }
    } else if (result.error().code != ErrorCode::EgressDenied &&
               result.error().code != ErrorCode::BackendUnavailable) {
        result = std::unexpected(PipelineError{ErrorCode::TranscriptionFailed,
                                               task.backend->id() + ": " + result.error().detail});
    }

    complete(task, std::move(result));
}

void TranscriptionDispatcher::complete(const Task& task,
                                       std::expected<TranscriptResult, PipelineError> result) {
    std::vector<DispatchOutcome> ready;

    std::unique_lock lock(mutex_);
    --running_;
    if (!task.streaming) running_exclusive_ = false;

    if (task.session == live_session_.load(std::memory_order_relaxed)) {
        if (auto it = slots_.find(task.index); it != slots_.end()) {
            it->second.result = std::move(result);
            completed_.insert(slots_.extract(it));
        }
        for (auto it = completed_.find(next_deliver_); it != completed_.end();
             it = completed_.find(next_deliver_)) {
            ready.push_back(std::move(it->second));
            completed_.erase(it);
            ++next_deliver_;
        }
    }

    pump();
    cv_.notify_all();
    if (ready.empty()) return;

    ++delivering_;
    {
        // Taken before mutex_ is released so batches reach the sink in order.
        std::unique_lock dl(delivery_mutex_);
        lock.unlock();
        deliver(ready);
    }

    lock.lock();
    --delivering_;
    cv_.notify_all();
}

void TranscriptionDispatcher::deliver(std::vector<DispatchOutcome>& ready) {
    for (auto& outcome : ready) {
        // The session may have ended after this batch was collected.
        if (outcome.session != live_session_.load(std::memory_order_acquire)) return;
        if (!outcome.result) {
            logging::error("dispatch", "segment " + std::to_string(outcome.segment) + ": " +
                                           outcome.result.error().describe());
        }
        if (sink_) sink_(outcome);
    }
}

size_t TranscriptionDispatcher::in_flight() const {
    std::lock_guard lock(mutex_);
    return running_ + queued_.size();
}

bool TranscriptionDispatcher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return running_ == 0 && queued_.empty() && delivering_ == 0;
    });
}
