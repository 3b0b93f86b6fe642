/**
 * Thread pool for batch tokenization.
 *
 * Fixed worker count, one shared FIFO queue. Tasks are never dropped; the
 * destructor drains the queue before joining.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace ipaseg {

class ThreadPool {
public:
    using Task = std::function<void()>;

    // 0 = hardware concurrency
    explicit ThreadPool(size_t num_threads = 0) : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::thread::hardware_concurrency();
        }
        num_threads_ = std::max(size_t(1), num_threads);

        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this);
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a task and get a future for the result
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    // Run func(i) for every i in [begin, end) and wait; rethrows the first task exception
    template<typename Func>
    void parallel_for(size_t begin, size_t end, Func&& func) {
        if (begin >= end) return;

        const size_t total = end - begin;
        const size_t chunk_size = std::max(size_t(1), total / (num_threads_ * 4));

        std::vector<std::future<void>> futures;
        futures.reserve(total / chunk_size + 1);

        for (size_t i = begin; i < end; i += chunk_size) {
            size_t chunk_end = std::min(i + chunk_size, end);
            futures.push_back(submit([&func, i, chunk_end]() {
                for (size_t j = i; j < chunk_end; ++j) {
                    func(j);
                }
            }));
        }

        for (auto& future : futures) {
            future.wait();
        }
        for (auto& future : futures) {
            future.get();
        }
    }

    size_t num_threads() const noexcept { return num_threads_; }

private:
    void worker_loop() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
                if (stop_ && queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop();
            }
            task();
        }
    }

    size_t num_threads_ = 1;
    std::vector<std::thread> workers_;
    std::queue<Task> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_;
};

} // namespace ipaseg
