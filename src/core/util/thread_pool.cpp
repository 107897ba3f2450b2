/**
 * @file thread_pool.cpp
 * @brief ThreadPool workers and backlog handling.
 *
 * @date 2025
 */
#include "cmdrelay/core/util/thread_pool.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include <algorithm>
#include <exception>
#include <format>

namespace cmdrelay {

    ThreadPool::ThreadPool(std::size_t workers, std::size_t maxBacklog)
        : maxBacklog_(maxBacklog)
    {
        if (workers == 0)
            workers = std::max(1u, std::thread::hardware_concurrency());

        workers_.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
            workers_.emplace_back([this] { run(); });
    }

    ThreadPool::~ThreadPool() {
        drain();
    }

    bool ThreadPool::trySubmit(Task task) {
        {
            std::scoped_lock lk(mx_);
            if (draining_ || (maxBacklog_ != 0 && backlog_.size() >= maxBacklog_)) {
                ++rejected_;
                return false;
            }
            backlog_.push_back(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    void ThreadPool::drain() {
        std::vector<std::jthread> joining;
        {
            std::scoped_lock lk(mx_);
            draining_ = true;
            joining.swap(workers_);
        }
        cv_.notify_all();
        // jthread joins on destruction
        joining.clear();
    }

    std::size_t ThreadPool::workerCount() const {
        std::scoped_lock lk(mx_);
        return workers_.size();
    }

    std::size_t ThreadPool::backlog() const {
        std::scoped_lock lk(mx_);
        return backlog_.size();
    }

    void ThreadPool::run() {
        for (;;) {
            Task task;
            {
                std::unique_lock lk(mx_);
                cv_.wait(lk, [this] { return draining_ || !backlog_.empty(); });
                if (backlog_.empty()) return;       // draining and nothing left
                task = std::move(backlog_.front());
                backlog_.pop_front();
            }

            try {
                task();
            }
            catch (const std::exception& e) {
                ++failed_;
                LOG_ERROR(std::format("pool task threw: {}", e.what()));
            }
            catch (...) {
                ++failed_;
                LOG_ERROR("pool task threw a non-standard exception");
            }
        }
    }

}
