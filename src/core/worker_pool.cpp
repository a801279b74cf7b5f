#include "minikv/worker_pool.hpp"

#include <exception>
#include <iostream>

namespace minikv {

WorkerPool::WorkerPool(size_t num_workers) {
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; i++) {
        workers_.emplace_back([this](std::stop_token stop_token) {
            worker_loop(stop_token);
        });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::submit(Job job) {
    {
        std::lock_guard lock(jobs_mutex_);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::stop() {
    for (auto& worker : workers_)
        worker.request_stop();
    workers_.clear(); // jthread joins on destruction

    std::lock_guard lock(jobs_mutex_);
    jobs_.clear();
}

std::optional<WorkerPool::Job> WorkerPool::wait_and_pop_front(std::stop_token stop_token) {
    std::unique_lock lock(jobs_mutex_);
    // C++20 wait: stays asleep until data exists OR stop is requested
    bool success = cv_.wait(lock, stop_token, [this]() {
        return !jobs_.empty();
    });

    if (!success || jobs_.empty()) {
        return std::nullopt;
    }

    Job job = std::move(jobs_.front());
    jobs_.pop_front();
    return job;
}

void WorkerPool::worker_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        auto job = wait_and_pop_front(stop_token);
        if (!job)
            continue;
        try {
            (*job)();
        } catch (const std::exception& e) {
            std::cerr << "[Worker] Job failed: " << e.what() << "\n";
        }
    }
}

} // namespace minikv
