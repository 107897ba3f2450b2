#include "cmdrelay/core/cache/idempotency_cache.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include <format>
#include <stdexcept>

namespace cmdrelay {

    IdempotencyCache::IdempotencyCache(std::size_t capacity, std::chrono::milliseconds ttl, ClockFn clock)
        : capacity_(capacity), ttl_(ttl), clock_(std::move(clock))
    {
        if (capacity_ == 0)
            throw std::invalid_argument("IdempotencyCache: capacity must be > 0");
        if (ttl_.count() <= 0)
            throw std::invalid_argument("IdempotencyCache: ttl must be > 0");
        if (!clock_)
            clock_ = [] { return SteadyClock::now(); };
        index_.reserve(capacity_);
    }

    void IdempotencyCache::eraseLocked(Lru::iterator it) {
        index_.erase(it->msgId);
        lru_.erase(it);
    }

    void IdempotencyCache::record(const std::string& msgId, Outcome outcome) {
        const auto now = clock_();
        std::scoped_lock lk(mx_);

        auto found = index_.find(msgId);
        if (found != index_.end()) {
            auto it = found->second;
            if (!expiredLocked(*it, now)) {
                it->rec.outcome = outcome;
                lru_.splice(lru_.begin(), lru_, it);
                return;
            }
            eraseLocked(it);
            ++expirations_;
        }

        // expired entries at the cold end go first, then plain LRU eviction
        while (!lru_.empty() && expiredLocked(lru_.back(), now)) {
            eraseLocked(std::prev(lru_.end()));
            ++expirations_;
        }
        while (lru_.size() >= capacity_) {
            LOG_TRACE(std::format("idempotency cache: evicting {}", lru_.back().msgId));
            eraseLocked(std::prev(lru_.end()));
            ++evictions_;
        }

        lru_.push_front(Entry{ msgId, IdempotencyRecord{ outcome, now } });
        index_.emplace(msgId, lru_.begin());
        ++inserts_;
    }

    std::optional<Outcome> IdempotencyCache::lookup(const std::string& msgId) {
        const auto now = clock_();
        std::scoped_lock lk(mx_);

        auto found = index_.find(msgId);
        if (found == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        auto it = found->second;
        if (expiredLocked(*it, now)) {
            eraseLocked(it);
            ++expirations_;
            ++misses_;
            return std::nullopt;
        }
        lru_.splice(lru_.begin(), lru_, it);
        ++hits_;
        return it->rec.outcome;
    }

    std::optional<IdempotencyRecord> IdempotencyCache::peek(const std::string& msgId) const {
        const auto now = clock_();
        std::scoped_lock lk(mx_);
        auto found = index_.find(msgId);
        if (found == index_.end() || expiredLocked(*found->second, now))
            return std::nullopt;
        return found->second->rec;
    }

    bool IdempotencyCache::erase(const std::string& msgId) {
        std::scoped_lock lk(mx_);
        auto found = index_.find(msgId);
        if (found == index_.end()) return false;
        eraseLocked(found->second);
        return true;
    }

    std::size_t IdempotencyCache::purgeExpired() {
        const auto now = clock_();
        std::scoped_lock lk(mx_);
        std::size_t n = 0;
        for (auto it = lru_.begin(); it != lru_.end();) {
            auto cur = it++;
            if (expiredLocked(*cur, now)) {
                eraseLocked(cur);
                ++n;
            }
        }
        expirations_ += n;
        return n;
    }

    std::size_t IdempotencyCache::size() const {
        std::scoped_lock lk(mx_);
        return lru_.size();
    }

    CacheStats IdempotencyCache::stats() const {
        std::scoped_lock lk(mx_);
        CacheStats s;
        s.hits = hits_;
        s.misses = misses_;
        s.inserts = inserts_;
        s.evictions = evictions_;
        s.expirations = expirations_;
        s.size = lru_.size();
        s.capacity = capacity_;
        return s;
    }

}
