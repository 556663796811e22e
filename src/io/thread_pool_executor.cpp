// ============================================================================
// ThreadPoolExecutor Implementation
// ============================================================================

#include "paratask/io/thread_pool_executor.hpp"

#include <exception>

#include "paratask/core/error.hpp"
#include "paratask/core/log.hpp"

namespace paratask {

ThreadPoolExecutor::ThreadPoolExecutor() : ThreadPoolExecutor(Options{}) {}

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) {
    options_.num_threads = num_threads;
    if (options_.num_threads == 0) {
        options_.num_threads = 1;
    }
    InitWorkers();
}

ThreadPoolExecutor::ThreadPoolExecutor(const Options& options)
    : options_(options) {
    if (options_.num_threads == 0) {
        options_.num_threads = 1;
    }
    InitWorkers();
}

void ThreadPoolExecutor::InitWorkers() {
    running_ = true;

    workers_.reserve(options_.num_threads);
    for (size_t i = 0; i < options_.num_threads; ++i) {
        workers_.emplace_back([this, i] { WorkerLoop(i); });
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Stop();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPoolExecutor::Post(std::function<void()> callback) {
    if (!callback) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            PARATASK_LOG_WARN("Dropping callback posted to a stopped thread pool");
            return;
        }
        work_queue_.push(std::move(callback));
    }
    work_available_.notify_one();
}

void ThreadPoolExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        running_ = false;
    }
    work_available_.notify_all();
    idle_.notify_all();
}

bool ThreadPoolExecutor::IsRunning() const {
    return running_;
}

void ThreadPoolExecutor::WaitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] {
        return stopping_ || (work_queue_.empty() && active_tasks_ == 0);
    });
}

void ThreadPoolExecutor::WorkerLoop(size_t worker_index) {
    ExecutorScope scope(this);

    if (options_.cpu_affinity.IsSet()) {
        int cpu = options_.cpu_affinity.cpus[worker_index % options_.cpu_affinity.cpus.size()];
        if (auto ec = SetThreadAffinity(CpuAffinity::SingleCore(cpu))) {
            PARATASK_LOG_WARN("Worker {} could not be pinned to cpu {}: {}", worker_index, cpu, ec.message());
        }
    }
    if (!options_.thread_name_prefix.empty()) {
        if (auto ec = SetThreadName(options_.thread_name_prefix + "-" + std::to_string(worker_index))) {
            PARATASK_LOG_DEBUG("Worker {} could not be named: {}", worker_index, ec.message());
        }
    }
    if (options_.nice_value != 0) {
        if (auto ec = SetThreadNice(options_.nice_value)) {
            PARATASK_LOG_WARN("Worker {} could not set nice {}: {}", worker_index, options_.nice_value,
                              ec.message());
        }
    }

    while (true) {
        std::function<void()> callback;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            work_available_.wait(lock, [this] {
                return stopping_ || !work_queue_.empty();
            });

            if (stopping_) {
                break;
            }

            callback = std::move(work_queue_.front());
            work_queue_.pop();
            // Counted under the lock so WaitIdle() never sees an empty
            // queue with the callback in flight.
            ++active_tasks_;
        }

        // Pipeline stages catch user exceptions themselves; anything arriving
        // here came from a raw Post() and must not take the worker down.
        try {
            callback();
        } catch (...) {
            PARATASK_LOG_ERROR("Exception escaped executor callback on worker {}: {}", worker_index,
                               DescribeException(std::current_exception()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_tasks_;
            if (work_queue_.empty() && active_tasks_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

}  // namespace paratask
