#include "transcription/worker_pool.hpp"

#include <algorithm>

WorkerPool::WorkerPool(size_t threads) {
    threads = std::max<size_t>(threads, 1);
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this](std::stop_token st) { run(st); });
    }
}

WorkerPool::~WorkerPool() {
    for (auto& t : threads_) t.request_stop();
    cv_.notify_all();
    threads_.clear(); // joins
}

void WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::run(std::stop_token st) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, st, [this] { return !tasks_.empty(); })) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}
