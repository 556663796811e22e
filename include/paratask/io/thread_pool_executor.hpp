// ============================================================================
// paratask/io/thread_pool_executor.hpp - Multi-Threaded Worker Pool
// ============================================================================
//
// ThreadPoolExecutor is the default shared pool behind a TaskGroup: a fixed
// number of worker threads pulling callbacks from one mutex-protected FIFO.
// A group that is not given an executor creates one sized to the hardware
// concurrency; several groups may share a caller-owned instance.
//
// KEY CONCEPTS:
// -------------
// 1. WORKER THREADS: started in the constructor, joined in the destructor
// 2. FIFO QUEUE: callbacks are dequeued in posting order, but run in
//    parallel, so completion order is unspecified
// 3. NO AFFINITY BETWEEN STAGES: consecutive stages of one task may run on
//    different workers
//
// USAGE:
// ------
//   ThreadPoolExecutor::Options opts;
//   opts.num_threads = 4;
//   opts.cpu_affinity = CpuAffinity::Range(0, 3);
//   opts.thread_name_prefix = "fetch";
//   ThreadPoolExecutor executor(opts);
//
//   executor.Post([] { DoWork(); });
//   executor.WaitIdle();
//
// ============================================================================

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "paratask/io/executor.hpp"
#include "paratask/io/thread_utils.hpp"

namespace paratask {

class ThreadPoolExecutor : public Executor {
public:
    struct Options {
        // Number of worker threads (default: hardware_concurrency, min 1)
        size_t num_threads = std::thread::hardware_concurrency();

        // Workers are assigned round-robin: worker[i] -> cpus[i % cpus.size()]
        CpuAffinity cpu_affinity;

        // Workers are named "prefix-0", "prefix-1", ...
        std::string thread_name_prefix = "paratask";

        int nice_value = 0;

        Options() = default;
    };

    ThreadPoolExecutor();

    explicit ThreadPoolExecutor(size_t num_threads);

    explicit ThreadPoolExecutor(const Options& options);

    // Stops and joins the workers. Callbacks still queued are dropped.
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    // Dropped with a warning once Stop() has been called
    void Post(std::function<void()> callback) override;

    void Stop() override;

    bool IsRunning() const override;

    // Block until the queue is empty and no worker is running a callback.
    // Returns immediately once the pool is stopped.
    void WaitIdle();

    size_t NumThreads() const { return workers_.size(); }

private:
    void WorkerLoop(size_t worker_index);

    void InitWorkers();

    Options options_;

    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> work_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    size_t active_tasks_{0};  // guarded by queue_mutex_
};

}  // namespace paratask
