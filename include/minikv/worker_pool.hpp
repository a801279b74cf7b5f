#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace minikv {

/*
 * Fixed set of std::jthread workers pulling jobs from one FIFO.
 * The reactor submits, workers run. stop() (or the destructor) asks every
 * worker to finish the job in hand and exit; queued jobs are dropped.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t num_workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Job job);
    void stop();

    size_t size() const noexcept { return workers_.size(); }

private:
    // Blocks until a job exists or stop is requested
    std::optional<Job> wait_and_pop_front(std::stop_token stop_token);
    void worker_loop(std::stop_token stop_token);

    std::deque<Job> jobs_;
    std::mutex jobs_mutex_;
    std::condition_variable_any cv_;
    std::vector<std::jthread> workers_;
};

} // namespace minikv
