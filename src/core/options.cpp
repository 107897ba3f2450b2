#include "cmdrelay/core/options.hpp"
#include "cmdrelay/core/options_json.hpp"
#include "cmdrelay/core/strategies/capped_backoff.hpp"
#include "cmdrelay/core/strategies/jittered_backoff.hpp"
#include <format>
#include <fstream>
#include <stdexcept>
#include <string>

namespace cmdrelay {

    namespace {
        constexpr uint32_t MAX_QUEUE_DEPTH   = 4096;
        constexpr uint32_t MAX_ATTEMPTS      = 16;
        constexpr uint32_t MAX_FRAME_CAP     = 16 * 1024 * 1024;

        [[noreturn]] void bad(const std::string& field, const std::string& why) {
            throw std::invalid_argument("RelayOptions." + field + ": " + why);
        }
    }

    const char* toString(OverflowPolicy p) {
        switch (p) {
            case OverflowPolicy::RejectNew:        return "reject_new";
            case OverflowPolicy::DropOldest:       return "drop_oldest";
            case OverflowPolicy::BlockWithTimeout: return "block_with_timeout";
        }
        return "unknown";
    }

    const char* toString(BackoffKind k) {
        switch (k) {
            case BackoffKind::Linear:      return "linear";
            case BackoffKind::Exponential: return "exponential";
        }
        return "unknown";
    }

    const char* toString(PayloadFormat f) {
        switch (f) {
            case PayloadFormat::Json:    return "json";
            case PayloadFormat::MsgPack: return "msgpack";
        }
        return "unknown";
    }

    OverflowPolicy overflowPolicyFromString(std::string_view s) {
        if (s == "reject_new")         return OverflowPolicy::RejectNew;
        if (s == "drop_oldest")        return OverflowPolicy::DropOldest;
        if (s == "block_with_timeout") return OverflowPolicy::BlockWithTimeout;
        throw std::invalid_argument("unknown overflow policy: " + std::string(s));
    }

    BackoffKind backoffKindFromString(std::string_view s) {
        if (s == "linear")      return BackoffKind::Linear;
        if (s == "exponential") return BackoffKind::Exponential;
        throw std::invalid_argument("unknown backoff kind: " + std::string(s));
    }

    PayloadFormat payloadFormatFromString(std::string_view s) {
        if (s == "json")    return PayloadFormat::Json;
        if (s == "msgpack") return PayloadFormat::MsgPack;
        throw std::invalid_argument("unknown payload format: " + std::string(s));
    }

    void RelayOptions::validate() const {
        if (queueDepth == 0 || queueDepth > MAX_QUEUE_DEPTH)
            bad("queueDepth", std::format("must be in 1..{}", MAX_QUEUE_DEPTH));
        if (overflowPolicy == OverflowPolicy::BlockWithTimeout && enqueueBlockTimeoutMs == 0)
            bad("enqueueBlockTimeoutMs", "must be > 0 with block_with_timeout");
        if (maxAttempts == 0 || maxAttempts > MAX_ATTEMPTS)
            bad("maxAttempts", std::format("must be in 1..{}", MAX_ATTEMPTS));
        if (baseBackoffMs == 0)
            bad("baseBackoffMs", "must be > 0");
        if (maxBackoffMs < baseBackoffMs)
            bad("maxBackoffMs", "must be >= baseBackoffMs");
        if (!(jitterFraction >= 0.0 && jitterFraction < 1.0))
            bad("jitterFraction", "must be in [0, 1)");
        if (cacheCapacity == 0)
            bad("cacheCapacity", "must be > 0");
        if (cacheTtlMs == 0)
            bad("cacheTtlMs", "must be > 0");
        if (maxFrameBytes == 0 || maxFrameBytes > MAX_FRAME_CAP)
            bad("maxFrameBytes", std::format("must be in 1..{}", MAX_FRAME_CAP));
        if (connectTimeoutMs == 0)
            bad("connectTimeoutMs", "must be > 0");
        if (sendTimeoutMs == 0)
            bad("sendTimeoutMs", "must be > 0");
        if (ioTimeoutMs == 0)
            bad("ioTimeoutMs", "must be > 0");
        if (commandDeadlineMs < ioTimeoutMs)
            bad("commandDeadlineMs", "must be >= ioTimeoutMs");
    }

    std::shared_ptr<IBackoffStrategy> RelayOptions::makeBackoff() const {
        std::shared_ptr<IBackoffStrategy> inner = backoffStrategy;
        if (!inner) {
            const auto base = std::chrono::milliseconds(baseBackoffMs);
            const auto cap  = std::chrono::milliseconds(maxBackoffMs);
            if (backoffKind == BackoffKind::Exponential)
                inner = std::make_shared<ExponentialBackoff>(base, cap);
            else
                inner = std::make_shared<LinearBackoff>(base, cap);
        }
        return std::make_shared<JitteredBackoff>(std::move(inner), jitterFraction);
    }

    /*──────────────── JSON ───────────────*/

    namespace {
        template<typename T>
        void readField(const nlohmann::json& doc, const char* key, T& out) {
            auto it = doc.find(key);
            if (it == doc.end()) return;
            try {
                out = it->get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw std::invalid_argument(std::string("options: bad value for '") + key + "': " + e.what());
            }
        }

        template<typename E, typename Parse>
        void readEnum(const nlohmann::json& doc, const char* key, E& out, Parse parse) {
            auto it = doc.find(key);
            if (it == doc.end()) return;
            if (!it->is_string())
                throw std::invalid_argument(std::string("options: '") + key + "' must be a string");
            out = parse(it->template get<std::string>());
        }
    }

    RelayOptions optionsFromJson(const nlohmann::json& doc, RelayOptions base) {
        if (!doc.is_object())
            throw std::invalid_argument("options: document must be a JSON object");

        readField(doc, "queue_depth",              base.queueDepth);
        readEnum (doc, "overflow_policy",          base.overflowPolicy, overflowPolicyFromString);
        readField(doc, "enqueue_block_timeout_ms", base.enqueueBlockTimeoutMs);
        readField(doc, "max_attempts",             base.maxAttempts);
        readField(doc, "base_backoff_ms",          base.baseBackoffMs);
        readField(doc, "max_backoff_ms",           base.maxBackoffMs);
        readField(doc, "jitter_fraction",          base.jitterFraction);
        readEnum (doc, "backoff_kind",             base.backoffKind, backoffKindFromString);
        readField(doc, "cache_capacity",           base.cacheCapacity);
        readField(doc, "cache_ttl_ms",             base.cacheTtlMs);
        readField(doc, "max_frame_bytes",          base.maxFrameBytes);
        readField(doc, "connect_timeout_ms",       base.connectTimeoutMs);
        readField(doc, "send_timeout_ms",          base.sendTimeoutMs);
        readField(doc, "io_timeout_ms",            base.ioTimeoutMs);
        readField(doc, "command_deadline_ms",      base.commandDeadlineMs);
        readField(doc, "reuse_connection",         base.reuseConnection);
        readEnum (doc, "payload_format",           base.payloadFormat, payloadFormatFromString);

        base.validate();
        return base;
    }

    RelayOptions loadOptionsFile(const std::string& path, RelayOptions base) {
        std::ifstream in(path);
        if (!in)
            throw std::invalid_argument("options: cannot open " + path);
        nlohmann::json doc;
        try {
            in >> doc;
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument("options: " + path + ": " + e.what());
        }
        return optionsFromJson(doc, std::move(base));
    }

    nlohmann::json optionsToJson(const RelayOptions& o) {
        return nlohmann::json{
            { "queue_depth",              o.queueDepth },
            { "overflow_policy",          toString(o.overflowPolicy) },
            { "enqueue_block_timeout_ms", o.enqueueBlockTimeoutMs },
            { "max_attempts",             o.maxAttempts },
            { "base_backoff_ms",          o.baseBackoffMs },
            { "max_backoff_ms",           o.maxBackoffMs },
            { "jitter_fraction",          o.jitterFraction },
            { "backoff_kind",             toString(o.backoffKind) },
            { "cache_capacity",           o.cacheCapacity },
            { "cache_ttl_ms",             o.cacheTtlMs },
            { "max_frame_bytes",          o.maxFrameBytes },
            { "connect_timeout_ms",       o.connectTimeoutMs },
            { "send_timeout_ms",          o.sendTimeoutMs },
            { "io_timeout_ms",            o.ioTimeoutMs },
            { "command_deadline_ms",      o.commandDeadlineMs },
            { "reuse_connection",         o.reuseConnection },
            { "payload_format",           toString(o.payloadFormat) }
        };
    }

}
