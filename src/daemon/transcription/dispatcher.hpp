#pragma once

#include "errors.hpp"
#include "transcription/backend.hpp"
#include "transcription/worker_pool.hpp"
#include "vad/speech_segment.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class EgressGuard;

struct DispatcherOptions {
    size_t reorder_window = 8;
    size_t compute_threads = 0; // 0: hardware concurrency
    size_t io_threads = 2;
    std::chrono::milliseconds backpressure_timeout{5000};
};

// One per submitted segment, delivered in submission order. A failed
// segment is reported in its slot and the stream moves on.
struct DispatchOutcome {
    uint64_t session = 0;
    uint64_t index = 0;          // submission order within the session
    uint64_t segment = 0;        // SpeechSegment::sequence()
    double start_s = 0.0;
    double duration_s = 0.0;
    std::expected<TranscriptResult, PipelineError> result;
};

// Routes speech segments to the active backend and delivers results in
// segment order.
//
// The active backend is bound to a request when it is submitted, so a hot
// swap only affects later submissions. Backends that require the network get
// a client from the EgressGuard at registration. Non-streaming backends see
// one call at a time; streaming backends up to reorder_window at once.
//
// The sink runs on a pool thread and must not call back into the dispatcher.
class TranscriptionDispatcher {
public:
    using DeliverySink = std::function<void(const DispatchOutcome&)>;

    TranscriptionDispatcher(EgressGuard& guard, DispatcherOptions options, DeliverySink sink);
    ~TranscriptionDispatcher();

    TranscriptionDispatcher(const TranscriptionDispatcher&) = delete;
    TranscriptionDispatcher& operator=(const TranscriptionDispatcher&) = delete;

    void register_backend(std::shared_ptr<TranscriptionBackend> backend);

    // Explicit selection only; an unavailable backend is never swapped out automatically.
    std::expected<void, PipelineError> select_backend(const std::string& id);
    std::string active_backend_id() const;
    std::shared_ptr<TranscriptionBackend> find_backend(const std::string& id) const;
    std::vector<std::shared_ptr<TranscriptionBackend>> backends() const;

    // Applies to segments submitted from now on.
    void set_options(TranscribeOptions options);

    uint64_t begin_session();

    // Queued requests are cancelled; results of calls still running are discarded.
    void end_session();

    bool session_active() const;

    // Blocks up to backpressure_timeout while reorder_window results are
    // undelivered. The segment is wiped on every path.
    std::expected<void, PipelineError> submit(SpeechSegment segment);

    size_t in_flight() const;
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    struct Task {
        uint64_t session;
        uint64_t index;
        std::shared_ptr<TranscriptionBackend> backend;
        bool streaming;
        bool remote;
        std::shared_ptr<SpeechSegment> segment;
        TranscribeOptions options;
    };

    void pump();                       // mutex_ held
    void execute(const Task& task);
    void complete(const Task& task, std::expected<TranscriptResult, PipelineError> result);
    void deliver(std::vector<DispatchOutcome>& ready);
    void cancel_session(); // mutex_ held

    EgressGuard& guard_;
    DispatcherOptions options_;
    DeliverySink sink_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::vector<std::shared_ptr<TranscriptionBackend>> backends_;
    std::shared_ptr<TranscriptionBackend> active_;
    TranscribeOptions transcribe_options_;

    uint64_t last_session_ = 0;
    std::atomic<uint64_t> live_session_{0}; // 0: no session
    uint64_t next_index_ = 0;
    uint64_t next_deliver_ = 0;
    std::map<uint64_t, DispatchOutcome> completed_; // awaiting earlier indices
    std::map<uint64_t, DispatchOutcome> slots_;     // submitted, not yet complete
    std::deque<Task> queued_;
    size_t running_ = 0;
    bool running_exclusive_ = false;
    size_t delivering_ = 0;

    std::mutex delivery_mutex_;

    // Last: destroyed first so no pool thread outlives the state above.
    WorkerPool compute_pool_;
    WorkerPool io_pool_;
};
