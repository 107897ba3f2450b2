#include "cmdrelay/core/observability/metrics_registry.hpp"
#include <algorithm>
#include <format>
#include <sstream>

namespace cmdrelay {

    namespace {
        struct FamilyInfo {
            const char* name;
            const char* help;
        };

        constexpr FamilyInfo COUNTERS[]{
            { "cmdrelay_attempts_total",                  "Command attempts by outcome." },
            { "cmdrelay_retries_total",                   "Retries scheduled after a failed attempt." },
            { "cmdrelay_commands_total",                  "Commands that reached a terminal state." },
            { "cmdrelay_idempotent_short_circuit_total",  "Retries skipped because the msg_id was already acknowledged." },
            { "cmdrelay_queue_rejected_total",            "Commands refused at enqueue." },
            { "cmdrelay_stray_responses_total",           "Responses that matched no awaiting command." },
        };

        std::string escapeLabel(const std::string& v) {
            std::string out;
            out.reserve(v.size());
            for (char c : v) {
                switch (c) {
                    case '\\': out += "\\\\"; break;
                    case '"':  out += "\\\""; break;
                    case '\n': out += "\\n"; break;
                    default:   out += c;
                }
            }
            return out;
        }

        std::string formatDouble(double v) {
            return std::format("{}", v);
        }
    }

    std::string renderLabels(const Labels& labels) {
        if (labels.empty()) return {};
        std::string out = "{";
        for (std::size_t i = 0; i < labels.size(); ++i) {
            if (i) out += ',';
            out += labels[i].first;
            out += "=\"";
            out += escapeLabel(labels[i].second);
            out += '"';
        }
        out += '}';
        return out;
    }

    const std::vector<double>& MetricsRegistry::latencyBuckets() {
        static const std::vector<double> b{ 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0 };
        return b;
    }

    MetricsRegistry::MetricsRegistry() = default;

    void MetricsRegistry::inc(const std::string& family, const Labels& labels, uint64_t by) {
        counters_[family][renderLabels(labels)] += by;
    }

    void MetricsRegistry::onAttempt(const AttemptEvent& ev) {
        std::scoped_lock lk(mx_);
        inc("cmdrelay_attempts_total", { { "device_id", ev.deviceId }, { "outcome", toString(ev.outcome) } });

        auto& h = latency_[ev.deviceId];
        const auto& bounds = latencyBuckets();
        if (h.buckets.empty()) h.buckets.assign(bounds.size(), 0);

        const double seconds = ev.elapsedMs / 1000.0;
        auto it = std::lower_bound(bounds.begin(), bounds.end(), seconds);
        if (it != bounds.end())
            ++h.buckets[static_cast<std::size_t>(it - bounds.begin())];
        ++h.count;
        h.sum += seconds;
    }

    void MetricsRegistry::onCompleted(const CommandResult& res) {
        std::scoped_lock lk(mx_);
        inc("cmdrelay_commands_total", {
            { "device_id", res.deviceId },
            { "result",    res.ok() ? "success" : "failed" },
            { "reason",    toString(res.reason) } });
    }

    void MetricsRegistry::onRetry(const std::string& deviceId, const std::string&, uint32_t, std::chrono::milliseconds) {
        std::scoped_lock lk(mx_);
        inc("cmdrelay_retries_total", { { "device_id", deviceId } });
    }

    void MetricsRegistry::onIdempotentShortCircuit(const std::string& deviceId, const std::string&) {
        std::scoped_lock lk(mx_);
        inc("cmdrelay_idempotent_short_circuit_total", { { "device_id", deviceId } });
    }

    void MetricsRegistry::onQueueRejected(const std::string& deviceId, FailReason reason) {
        std::scoped_lock lk(mx_);
        inc("cmdrelay_queue_rejected_total", { { "device_id", deviceId }, { "reason", toString(reason) } });
    }

    void MetricsRegistry::onStrayResponse(const std::string& deviceId, const std::string&) {
        std::scoped_lock lk(mx_);
        inc("cmdrelay_stray_responses_total", { { "device_id", deviceId } });
    }

    void MetricsRegistry::attachCache(std::shared_ptr<const IdempotencyCache> cache) {
        std::scoped_lock lk(mx_);
        cache_ = std::move(cache);
    }

    uint64_t MetricsRegistry::counter(const std::string& family, const Labels& labels) const {
        std::scoped_lock lk(mx_);
        auto f = counters_.find(family);
        if (f == counters_.end()) return 0;
        auto s = f->second.find(renderLabels(labels));
        return s == f->second.end() ? 0 : s->second;
    }

    uint64_t MetricsRegistry::latencyCount(const std::string& deviceId) const {
        std::scoped_lock lk(mx_);
        auto it = latency_.find(deviceId);
        return it == latency_.end() ? 0 : it->second.count;
    }

    std::string MetricsRegistry::render() const {
        std::scoped_lock lk(mx_);
        std::ostringstream out;

        for (const auto& fam : COUNTERS) {
            auto f = counters_.find(fam.name);
            if (f == counters_.end()) continue;
            out << "# HELP " << fam.name << ' ' << fam.help << '\n';
            out << "# TYPE " << fam.name << " counter\n";
            for (const auto& [labels, v] : f->second)
                out << fam.name << labels << ' ' << v << '\n';
        }

        if (!latency_.empty()) {
            constexpr const char* name = "cmdrelay_attempt_latency_seconds";
            out << "# HELP " << name << " Attempt duration including connect.\n";
            out << "# TYPE " << name << " histogram\n";
            const auto& bounds = latencyBuckets();
            for (const auto& [device, h] : latency_) {
                uint64_t cumulative = 0;
                for (std::size_t i = 0; i < bounds.size(); ++i) {
                    cumulative += h.buckets[i];
                    out << name << "_bucket"
                        << renderLabels({ { "device_id", device }, { "le", formatDouble(bounds[i]) } })
                        << ' ' << cumulative << '\n';
                }
                out << name << "_bucket" << renderLabels({ { "device_id", device }, { "le", "+Inf" } })
                    << ' ' << h.count << '\n';
                out << name << "_sum" << renderLabels({ { "device_id", device } }) << ' ' << formatDouble(h.sum) << '\n';
                out << name << "_count" << renderLabels({ { "device_id", device } }) << ' ' << h.count << '\n';
            }
        }

        if (cache_) {
            const CacheStats s = cache_->stats();
            auto gauge = [&](const char* name, const char* help, const char* type, uint64_t v) {
                out << "# HELP " << name << ' ' << help << '\n';
                out << "# TYPE " << name << ' ' << type << '\n';
                out << name << ' ' << v << '\n';
            };
            gauge("cmdrelay_dedup_cache_entries", "Records held by the idempotency cache.", "gauge", s.size);
            gauge("cmdrelay_dedup_cache_capacity", "Idempotency cache capacity.", "gauge", s.capacity);
            gauge("cmdrelay_dedup_cache_hits_total", "Idempotency cache lookups that found a record.", "counter", s.hits);
            gauge("cmdrelay_dedup_cache_misses_total", "Idempotency cache lookups that found nothing.", "counter", s.misses);
            gauge("cmdrelay_dedup_cache_evictions_total", "Records evicted at capacity.", "counter", s.evictions);
            gauge("cmdrelay_dedup_cache_expirations_total", "Records dropped after their TTL.", "counter", s.expirations);
        }

        return out.str();
    }

}
