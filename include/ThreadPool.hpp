/**
 * @file ThreadPool.hpp
 * @brief Fixed-size worker pool for embarrassingly parallel loops
 */

#ifndef SEBM_THREAD_POOL_HPP
#define SEBM_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace SEBM {

/**
 * @brief Simple thread pool for parallel operations
 *
 * parallelFor() blocks until every chunk has finished. An exception thrown
 * by a chunk is captured and rethrown on the calling thread once all chunks
 * are done; when several chunks throw, the one covering the lowest index
 * wins.
 */
class ThreadPool {
public:
    explicit ThreadPool(std::size_t num_threads = std::thread::hardware_concurrency()) {
        num_threads = std::max<std::size_t>(1, num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queue_mutex);
                        condition.wait(lock, [this] {
                            return stop || !tasks.empty();
                        });
                        if (stop && tasks.empty()) return;
                        task = std::move(tasks.front());
                        tasks.pop();
                    }
                    task();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            stop = true;
        }
        condition.notify_all();
        for (auto& worker : workers) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    void enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            tasks.emplace(std::forward<F>(f));
        }
        condition.notify_one();
    }

    /**
     * @brief Split [start, end) into one contiguous chunk per worker
     * @param body Called as body(chunk_start, chunk_end)
     */
    void parallelFor(std::size_t start, std::size_t end,
                     const std::function<void(std::size_t, std::size_t)>& body) {
        if (end <= start) return;

        const std::size_t n_threads = workers.size();
        const std::size_t chunk = (end - start + n_threads - 1) / n_threads;

        std::mutex done_mutex;
        std::condition_variable done;
        std::size_t pending = 0;
        std::vector<std::exception_ptr> errors(n_threads);

        for (std::size_t i = 0; i < n_threads; ++i) {
            const std::size_t chunk_start = start + i * chunk;
            const std::size_t chunk_end = std::min(chunk_start + chunk, end);
            if (chunk_start >= end) break;

            {
                std::lock_guard<std::mutex> lock(done_mutex);
                ++pending;
            }
            enqueue([&, i, chunk_start, chunk_end] {
                try {
                    body(chunk_start, chunk_end);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
                std::lock_guard<std::mutex> lock(done_mutex);
                if (--pending == 0) {
                    done.notify_one();
                }
            });
        }

        {
            std::unique_lock<std::mutex> lock(done_mutex);
            done.wait(lock, [&] { return pending == 0; });
        }

        for (const auto& error : errors) {
            if (error) std::rethrow_exception(error);
        }
    }

    std::size_t numThreads() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop = false;
};

} // namespace SEBM

#endif // SEBM_THREAD_POOL_HPP
