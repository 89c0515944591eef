#pragma once

// Internal header, not installed.
// std::jthread-based worker pool used to parse script lines in parallel.
// parallel_for keeps results index-addressed and reports failures in
// index order, so callers see the same outcome as a sequential loop.

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <latch>
#include <mutex>
#include <thread>
#include <vector>

namespace lilscript_cpp::detail {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int num_threads)
        : num_threads_{std::max(num_threads, 1u)} {
        workers_.reserve(num_threads_);
        for (unsigned int i = 0; i < num_threads_; ++i) {
            workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
        }
    }

    ~ThreadPool() {
        {
            auto lock = std::scoped_lock{mutex_};
            for (auto& worker : workers_) {
                worker.request_stop();
            }
        }
        cv_.notify_all();
        // std::jthread joins on destruction
    }

    ThreadPool(const ThreadPool&) = delete;
    auto operator=(const ThreadPool&) -> ThreadPool& = delete;
    ThreadPool(ThreadPool&&) = delete;
    auto operator=(ThreadPool&&) -> ThreadPool& = delete;

    // Number of workers worth starting for `count` items:
    // 0 = hardware_concurrency(), never more than there are items.
    static auto resolve_threads(unsigned int requested, std::size_t count) -> unsigned int {
        auto n = requested == 0 ? std::thread::hardware_concurrency() : requested;
        n = std::max(n, 1u);
        if (count < n) n = static_cast<unsigned int>(std::max<std::size_t>(count, 1));
        return n;
    }

    // Calls fn(i) for every i in [0, count), split into contiguous chunks.
    // Blocks until all chunks finish. If any call throws, the exception of
    // the lowest failing index is rethrown here; a chunk stops at its first
    // failure, and later chunks only cover higher indices.
    template <typename Fn>
    void parallel_for(std::size_t count, Fn&& fn) {
        if (count == 0) return;

        const auto chunks = std::min(static_cast<std::size_t>(num_threads_), count);
        auto failures = std::vector<std::exception_ptr>(chunks);
        auto done = std::latch{static_cast<std::ptrdiff_t>(chunks)};

        for (std::size_t c = 0; c < chunks; ++c) {
            const auto begin = c * count / chunks;
            const auto end = (c + 1) * count / chunks;
            submit([&fn, &done, &failures, c, begin, end]() {
                try {
                    for (auto i = begin; i < end; ++i) {
                        fn(i);
                    }
                } catch (...) {
                    failures[c] = std::current_exception();
                }
                done.count_down();
            });
        }

        done.wait();

        for (const auto& failure : failures) {
            if (failure) std::rethrow_exception(failure);
        }
    }

    auto size() const -> unsigned int { return num_threads_; }

private:
    void submit(std::function<void()> task) {
        {
            auto lock = std::scoped_lock{mutex_};
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    void worker_loop(std::stop_token st) {
        while (true) {
            auto task = std::function<void()>{};
            {
                auto lock = std::unique_lock{mutex_};
                cv_.wait(lock, [&] { return !tasks_.empty() || st.stop_requested(); });
                if (tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    unsigned int num_threads_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::jthread> workers_;
};

}  // namespace lilscript_cpp::detail
