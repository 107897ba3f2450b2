/**
 * @file command_queue.hpp
 * @brief Bounded per-device FIFO of pending commands.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "cmdrelay/core/types.hpp"
#include "cmdrelay/core/options.hpp"

namespace cmdrelay {

    /**
     * @struct EnqueueResult
     * @brief Outcome of CommandQueue::enqueue().
     *
     * With DropOldest an accepted enqueue may carry the evicted head in
     * @ref evicted; the caller must resolve it as FAILED(DroppedByOverflow).
     */
    struct EnqueueResult {
        enum class Status : uint8_t { Accepted, Rejected };

        Status     status{ Status::Accepted };
        FailReason reason{ FailReason::None };     ///< QueueFull, QueueTimeout or EngineStopped when rejected
        std::optional<Command> evicted;

        bool accepted() const { return status == Status::Accepted; }
    };

    /**
     * @class CommandQueue
     * @brief Thread-safe bounded FIFO with a configurable overflow policy.
     *
     * Producers call enqueue() from any thread; the device lane is the only consumer.
     */
    class CommandQueue {
    public:
        /**
         * @param capacity Maximum queued commands, must be > 0
         * @param policy What to do when full
         * @param blockTimeout Wait bound used by OverflowPolicy::BlockWithTimeout
         */
        CommandQueue(std::size_t capacity, OverflowPolicy policy,
                     std::chrono::milliseconds blockTimeout = std::chrono::milliseconds(500));

        CommandQueue(const CommandQueue&) = delete;
        CommandQueue& operator=(const CommandQueue&) = delete;

        EnqueueResult enqueue(Command cmd);

        /**
         * @brief Take the head, waiting up to @p timeout for one to arrive.
         * @return nullopt on timeout or when the queue is closed and empty
         */
        std::optional<Command> dequeue(std::chrono::milliseconds timeout);

        /**
         * @brief Remove a queued command by msg_id (cancellation).
         */
        std::optional<Command> remove(const std::string& msgId);

        /**
         * @brief Refuse further enqueues and wake all waiters.
         * @return Commands that were still queued
         */
        std::deque<Command> close();

        bool closed() const;
        std::size_t size() const;
        std::size_t capacity() const { return capacity_; }
        OverflowPolicy policy() const { return policy_; }

    private:
        const std::size_t capacity_;
        const OverflowPolicy policy_;
        const std::chrono::milliseconds blockTimeout_;

        mutable std::mutex mx_;
        std::condition_variable notEmpty_;
        std::condition_variable notFull_;
        std::deque<Command> q_;
        bool closed_{ false };
    };

}
