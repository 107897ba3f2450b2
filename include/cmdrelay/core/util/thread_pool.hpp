/**
 * @file thread_pool.hpp
 * @brief Fixed set of workers draining a bounded task backlog.
 *
 * Producers never wait: trySubmit() refuses a task when the backlog is at its
 * bound or the pool is draining. AsyncObserver relies on this so a slow
 * metrics or log sink cannot stall a device lane.
 *
 * @date 2025
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cmdrelay {

    /**
     * @class ThreadPool
     * @brief Fire-and-forget executor with a hard backlog limit.
     */
    class ThreadPool {
    public:
        using Task = std::function<void()>;

        /**
         * @param workers Worker count; 0 picks hardware_concurrency (at least 1)
         * @param maxBacklog Tasks allowed to wait for a worker; 0 means unbounded
         */
        explicit ThreadPool(std::size_t workers = 0, std::size_t maxBacklog = 0);

        /**
         * @brief Runs drain().
         */
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @return false when the task was refused (backlog full or draining)
         */
        bool trySubmit(Task task);

        /**
         * @brief Refuse new tasks, run the backlog to completion and join the workers. Idempotent.
         */
        void drain();

        std::size_t workerCount() const;
        std::size_t backlog() const;

        std::size_t rejected() const { return rejected_.load(); }

        /// Tasks that ended with an exception.
        std::size_t failed() const { return failed_.load(); }

    private:
        void run();

        mutable std::mutex mx_;
        std::condition_variable cv_;
        std::deque<Task> backlog_;          ///< guarded by mx_
        bool draining_{ false };            ///< guarded by mx_
        const std::size_t maxBacklog_;
        std::vector<std::jthread> workers_;
        std::atomic<std::size_t> rejected_{ 0 };
        std::atomic<std::size_t> failed_{ 0 };
    };

}
