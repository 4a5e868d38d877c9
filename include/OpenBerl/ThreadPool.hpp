// =================================================================
// include/OpenBerl/ThreadPool.hpp
// =================================================================
// Fixed-size worker pool used for parallel pipeline steps.

#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace OpenBerl {

/**
 * @brief Fixed-size pool running pipeline steps and handing back futures
 *
 * Steps are taken in submission order. shutdown() stops intake, lets the
 * workers drain what is already queued and joins them; the destructor calls it.
 * Several pipeline executions may submit to one pool at the same time.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t worker_count) {
        worker_count = worker_count == 0 ? 1 : worker_count;
        m_workers.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            m_workers.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a step
     * @return Future for the callable's result; exceptions surface through get()
     * @throws std::runtime_error after shutdown()
     */
    template<typename F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
        using Result = std::invoke_result_t<F>;

        auto job = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> future = job->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("Thread pool is shut down");
            }
            m_queue.emplace_back([job]() { (*job)(); });
        }
        m_wakeup.notify_one();
        return future;
    }

    /**
     * @brief Stop accepting work, finish queued jobs and join the workers
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                return;
            }
            m_stopping = true;
        }
        m_wakeup.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t size() const { return m_workers.size(); }

    /// Jobs currently running on a worker
    size_t busyWorkers() const { return m_busy; }

    /// Jobs waiting for a free worker
    size_t pendingJobs() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

private:
    void workerLoop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wakeup.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
                if (m_queue.empty()) {
                    return;
                }
                job = std::move(m_queue.front());
                m_queue.pop_front();
                ++m_busy;
            }

            // packaged_task stores any exception in the future
            job();
            --m_busy;
        }
    }

    std::vector<std::thread> m_workers;
    std::deque<std::function<void()>> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    bool m_stopping = false;
    std::atomic<size_t> m_busy{0};
};

} // namespace OpenBerl
