#include "cmdrelay/core/queue/command_queue.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace cmdrelay {

    CommandQueue::CommandQueue(std::size_t capacity, OverflowPolicy policy, std::chrono::milliseconds blockTimeout)
        : capacity_(capacity), policy_(policy), blockTimeout_(blockTimeout)
    {
        if (capacity_ == 0)
            throw std::invalid_argument("CommandQueue: capacity must be > 0");
        if (policy_ == OverflowPolicy::BlockWithTimeout && blockTimeout_.count() <= 0)
            throw std::invalid_argument("CommandQueue: block timeout must be > 0");
    }

    EnqueueResult CommandQueue::enqueue(Command cmd) {
        EnqueueResult res;
        std::unique_lock lk(mx_);

        if (closed_) {
            res.status = EnqueueResult::Status::Rejected;
            res.reason = FailReason::EngineStopped;
            return res;
        }

        if (q_.size() >= capacity_) {
            switch (policy_) {
                case OverflowPolicy::RejectNew:
                    res.status = EnqueueResult::Status::Rejected;
                    res.reason = FailReason::QueueFull;
                    return res;

                case OverflowPolicy::DropOldest:
                    res.evicted = std::move(q_.front());
                    q_.pop_front();
                    LOG_DEBUG(std::format("queue {}: dropped oldest {}", cmd.deviceId, res.evicted->msgId));
                    break;

                case OverflowPolicy::BlockWithTimeout: {
                    const bool room = notFull_.wait_for(lk, blockTimeout_,
                        [&] { return closed_ || q_.size() < capacity_; });
                    if (closed_) {
                        res.status = EnqueueResult::Status::Rejected;
                        res.reason = FailReason::EngineStopped;
                        return res;
                    }
                    if (!room) {
                        res.status = EnqueueResult::Status::Rejected;
                        res.reason = FailReason::QueueTimeout;
                        return res;
                    }
                    break;
                }
            }
        }

        q_.push_back(std::move(cmd));
        lk.unlock();
        notEmpty_.notify_one();
        return res;
    }

    std::optional<Command> CommandQueue::dequeue(std::chrono::milliseconds timeout) {
        std::unique_lock lk(mx_);
        if (!notEmpty_.wait_for(lk, timeout, [&] { return closed_ || !q_.empty(); }))
            return std::nullopt;
        if (q_.empty())
            return std::nullopt;

        Command c = std::move(q_.front());
        q_.pop_front();
        lk.unlock();
        notFull_.notify_one();
        return c;
    }

    std::optional<Command> CommandQueue::remove(const std::string& msgId) {
        std::unique_lock lk(mx_);
        auto it = std::find_if(q_.begin(), q_.end(),
            [&](const Command& c) { return c.msgId == msgId; });
        if (it == q_.end())
            return std::nullopt;

        Command c = std::move(*it);
        q_.erase(it);
        lk.unlock();
        notFull_.notify_one();
        return c;
    }

    std::deque<Command> CommandQueue::close() {
        std::deque<Command> rest;
        {
            std::scoped_lock lk(mx_);
            closed_ = true;
            rest.swap(q_);
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
        return rest;
    }

    bool CommandQueue::closed() const {
        std::scoped_lock lk(mx_);
        return closed_;
    }

    std::size_t CommandQueue::size() const {
        std::scoped_lock lk(mx_);
        return q_.size();
    }

}
