#include "cmdrelay/core/engine/retry_engine.hpp"
#include "cmdrelay/core/codec/frame_codec.hpp"
#include "cmdrelay/core/queue/command_queue.hpp"
#include "cmdrelay/core/util/error_types.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include "cmdrelay/core/util/time.hpp"

#include <folly/SharedMutex.h>
#include <folly/container/F14Map.h>
#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <thread>

namespace cmdrelay {

    namespace {
        constexpr auto LANE_POLL = std::chrono::milliseconds(100);

        struct Ticket {
            Command cmd;
            std::promise<CommandResult> promise;
            std::shared_future<CommandResult> future;
            TimePoint submittedAt{};
            TimePoint deadline{};
            std::atomic<bool> cancelled{ false };
            std::atomic<bool> done{ false };
        };
        using TicketPtr = std::shared_ptr<Ticket>;

        /// One device: its queue, its worker and the session currently on the wire.
        struct Lane {
            Lane(DeviceEndpoint e, const RelayOptions& o)
                : ep(std::move(e)),
                  queue(o.queueDepth, o.overflowPolicy, o.enqueueBlockTimeout()) {}

            DeviceEndpoint ep;                          ///< guarded by mx
            CommandQueue queue;
            std::unique_ptr<IDeviceSession> session;    ///< guarded by mx, used by the worker only

            std::mutex mx;
            std::condition_variable_any wakeCv;
            IDeviceSession* active{ nullptr };          ///< session inside an attempt, closed by cancel/stop
            std::string activeMsgId;                    ///< command currently owned by the worker
            Opcode activeOpcode{ Opcode::Toggle };
            bool wake{ false };                         ///< late response or cancel arrived during backoff

            std::jthread worker;
        };
        using LanePtr = std::shared_ptr<Lane>;

        struct AttemptResult {
            Outcome    outcome{ Outcome::Pending };
            FailReason reason{ FailReason::None };      ///< set for Outcome::Error
            bool       terminal{ false };
            bool       sent{ false };
            std::optional<DeviceResponse> response;
            std::string detail;
        };

        FailReason reasonFor(FrameErr e) {
            switch (e) {
                case FrameErr::BadMagic:           return FailReason::BadMagic;
                case FrameErr::UnsupportedVersion: return FailReason::UnsupportedVersion;
                case FrameErr::FrameTooLarge:      return FailReason::FrameTooLarge;
                case FrameErr::TruncatedFrame:     return FailReason::IOError;
            }
            return FailReason::IOError;
        }

        std::chrono::milliseconds bounded(std::chrono::milliseconds phase, TimePoint deadline) {
            return std::min(phase, remaining(deadline));
        }

        CommandResult failed(FailReason r, std::string detail) {
            CommandResult res;
            res.state = CommandState::Failed;
            res.reason = r;
            res.detail = std::move(detail);
            return res;
        }
    }

    /*────────────────────────────── Impl ──────────────────────────────*/

    struct RetryEngine::Impl {
        RelayOptions opts;
        std::shared_ptr<ISessionFactory> factory;
        std::shared_ptr<IdempotencyCache> cache;
        std::shared_ptr<IRelayObserver> observer;
        std::shared_ptr<IPayloadCodec> codec;
        std::shared_ptr<IBackoffStrategy> backoff;
        FrameCodec frames;

        mutable std::mutex ticketsMx;
        ankerl::unordered_dense::map<std::string, TicketPtr> tickets;

        std::atomic<bool> stopped{ false };

        // Last member: lane workers are joined before anything they touch is destroyed.
        mutable folly::SharedMutex lanesMx;
        folly::F14FastMap<std::string, LanePtr> lanes;

        Impl(RelayOptions o,
             std::shared_ptr<ISessionFactory> f,
             std::shared_ptr<IdempotencyCache> c,
             std::shared_ptr<IRelayObserver> obs,
             std::shared_ptr<IPayloadCodec> pc)
            : opts(std::move(o)),
              factory(std::move(f)),
              cache(std::move(c)),
              observer(std::move(obs)),
              codec(std::move(pc)),
              frames(opts.maxFrameBytes)
        {
            opts.validate();
            if (!factory)
                throw std::invalid_argument("RetryEngine: session factory is required");
            if (!cache)
                cache = std::make_shared<IdempotencyCache>(opts.cacheCapacity, opts.cacheTtl());
            if (!codec)
                codec = makePayloadCodec(opts.payloadFormat);
            backoff = opts.makeBackoff();
            LOG_DEBUG(std::format("retry engine: {} attempt(s), {} backoff from {} ms, {} payloads",
                opts.maxAttempts, backoff->name(), opts.baseBackoffMs, codec->name()));
        }

        template<typename F>
        void notify(const char* hook, F&& fn) {
            if (!observer) return;
            try {
                fn(*observer);
            }
            catch (const std::exception& e) {
                LOG_ERROR(std::format("observer {} threw: {}", hook, e.what()));
            }
        }

        LanePtr findLane(const std::string& deviceId) const {
            std::shared_lock lk(lanesMx);
            auto it = lanes.find(deviceId);
            return it == lanes.end() ? nullptr : it->second;
        }

        TicketPtr findTicket(const std::string& msgId) const {
            std::scoped_lock lk(ticketsMx);
            auto it = tickets.find(msgId);
            return it == tickets.end() ? nullptr : it->second;
        }

        /// Publish the terminal result exactly once.
        void resolve(const TicketPtr& t, CommandResult res) {
            if (t->done.exchange(true)) return;

            res.msgId = t->cmd.msgId;
            res.deviceId = t->cmd.deviceId;
            res.totalMs = elapsedMs(t->submittedAt);
            {
                std::scoped_lock lk(ticketsMx);
                auto it = tickets.find(res.msgId);
                if (it != tickets.end() && it->second == t)
                    tickets.erase(it);
            }

            if (res.ok()) {
                LOG_INFO(std::format("device {} msg {}: SUCCESS after {} attempt(s) in {:.1f} ms",
                    res.deviceId, res.msgId, res.attempts, res.totalMs));
            }
            else {
                LOG_WARN(std::format("device {} msg {}: FAILED({}) after {} attempt(s): {}",
                    res.deviceId, res.msgId, toString(res.reason), res.attempts, res.detail));
            }

            notify("onCompleted", [&](IRelayObserver& o) { o.onCompleted(res); });
            t->promise.set_value(std::move(res));
        }

        /*──────── sessions ────────*/

        IDeviceSession& obtainSession(Lane& lane) {
            std::unique_lock lk(lane.mx);
            if (opts.reuseConnection && lane.session && lane.session->isConnected()) {
                lane.active = lane.session.get();
                return *lane.session;
            }
            const DeviceEndpoint ep = lane.ep;
            auto old = std::move(lane.session);
            lk.unlock();

            if (old) old->close();
            auto fresh = factory->create(ep);
            if (!fresh)
                throw SessionError(SessionErr::IOError, "session factory returned no session");

            lk.lock();
            lane.session = std::move(fresh);
            lane.active = lane.session.get();
            return *lane.session;
        }

        /// End of an attempt: forget the active session and drop it unless it may be reused.
        void releaseSession(Lane& lane) {
            std::unique_ptr<IDeviceSession> old;
            {
                std::scoped_lock lk(lane.mx);
                lane.active = nullptr;
                if (!opts.reuseConnection || (lane.session && !lane.session->isConnected()))
                    old = std::move(lane.session);
            }
            if (old) old->close();
        }

        void dropSession(Lane& lane) {
            std::unique_ptr<IDeviceSession> old;
            {
                std::scoped_lock lk(lane.mx);
                lane.active = nullptr;
                old = std::move(lane.session);
            }
            if (old) old->close();
        }

        /*──────── one attempt ────────*/

        AttemptResult runAttempt(Lane& lane, const Command& cmd, const Ticket& t, const std::vector<uint8_t>& frame) {
            AttemptResult ar;
            try {
                IDeviceSession& s = obtainSession(lane);
                if (!s.isConnected())
                    s.connect(bounded(opts.connectTimeout(), t.deadline));

                s.send(frame, bounded(opts.sendTimeout(), t.deadline));
                ar.sent = true;

                // AWAITING_RESPONSE: anything that does not correlate is discarded
                const auto waitUntil = SteadyClock::now() + bounded(opts.ioTimeout(), t.deadline);
                for (;;) {
                    auto payload = s.receive(remaining(waitUntil));
                    auto rsp = codec->decodeResponse(payload);
                    if (!rsp) {
                        LOG_WARN(std::format("device {}: undecodable {} response ({} bytes) discarded",
                            cmd.deviceId, codec->name(), payload.size()));
                        continue;
                    }
                    if (rsp->msgId != cmd.msgId || rsp->opcode != cmd.opcode) {
                        LOG_WARN(std::format("device {}: uncorrelated response msg {} ({}) discarded, awaiting {}",
                            cmd.deviceId, rsp->msgId, toString(rsp->opcode), cmd.msgId));
                        notify("onStrayResponse", [&](IRelayObserver& o) { o.onStrayResponse(cmd.deviceId, rsp->msgId); });
                        continue;
                    }

                    ar.response = std::move(rsp);
                    if (ar.response->ack) {
                        ar.outcome = Outcome::Success;
                    }
                    else {
                        ar.outcome = Outcome::Error;
                        ar.reason = FailReason::DeviceRejected;
                        ar.terminal = true;
                        ar.detail = ar.response->error.empty() ? "device rejected the command" : ar.response->error;
                    }
                    return ar;
                }
            }
            catch (const SessionError& e) {
                ar.detail = std::format("{}: {}", toString(e.code()), e.what());
                switch (e.code()) {
                    case SessionErr::ConnectTimeout:
                    case SessionErr::RecvTimeout:
                        ar.outcome = Outcome::Timeout;
                        break;
                    case SessionErr::ConnectRefused:
                        ar.outcome = Outcome::Error;
                        ar.reason = FailReason::ConnectRefused;
                        break;
                    case SessionErr::SendTimeout:
                        ar.outcome = Outcome::Error;
                        ar.reason = FailReason::SendFailed;
                        break;
                    case SessionErr::PeerClosed:
                        ar.outcome = Outcome::Error;
                        ar.reason = FailReason::PeerClosed;
                        break;
                    case SessionErr::IOError:
                        ar.outcome = Outcome::Error;
                        ar.reason = FailReason::IOError;
                        ar.terminal = true;
                        break;
                }
            }
            catch (const FrameError& e) {
                ar.outcome = Outcome::Error;
                ar.reason = reasonFor(e.code());
                ar.terminal = true;
                ar.detail = std::format("{}: {}", toString(e.code()), e.what());
            }
            return ar;
        }

        void waitBackoff(Lane& lane, const Ticket& t, std::chrono::milliseconds delay, std::stop_token st) {
            const auto until = std::min(SteadyClock::now() + delay, t.deadline);
            std::unique_lock lk(lane.mx);
            lane.wakeCv.wait_until(lk, st, until, [&] { return lane.wake || t.cancelled.load(); });
            lane.wake = false;
        }

        /*──────── one command ────────*/

        void runCommand(Lane& lane, const Command& cmd, const TicketPtr& t, std::stop_token st) {
            CommandResult res;
            std::vector<uint8_t> frame;
            try {
                auto payload = codec->encodeRequest(cmd);
                // a msg_id the codec cannot carry verbatim would never correlate
                auto echo = codec->decodeRequest(payload);
                if (!echo || echo->msgId != cmd.msgId) {
                    resolve(t, failed(FailReason::InvalidCommand,
                        std::format("msg_id does not survive the {} codec", codec->name())));
                    return;
                }
                frame = frames.encode(payload);
            }
            catch (const FrameError& e) {
                resolve(t, failed(FailReason::FrameTooLarge, e.what()));
                return;
            }
            catch (const std::exception& e) {
                resolve(t, failed(FailReason::InvalidCommand, std::format("request encoding failed: {}", e.what())));
                return;
            }

            {
                std::scoped_lock lk(lane.mx);
                lane.activeMsgId = cmd.msgId;
                lane.activeOpcode = cmd.opcode;
                lane.wake = false;
            }

            auto finish = [&](CommandState s, FailReason r, std::string detail) {
                res.state = s;
                res.reason = r;
                res.detail = std::move(detail);
            };

            auto cachedSuccess = [&] {
                auto rec = cache->lookup(cmd.msgId);
                if (!rec || *rec != Outcome::Success) return false;
                LOG_INFO(std::format("device {} msg {}: already acknowledged, not re-sending", cmd.deviceId, cmd.msgId));
                notify("onIdempotentShortCircuit", [&](IRelayObserver& o) { o.onIdempotentShortCircuit(cmd.deviceId, cmd.msgId); });
                finish(CommandState::Success, FailReason::None, "already acknowledged");
                return true;
            };

            FailReason lastError = FailReason::None;
            std::string lastDetail;

            for (uint32_t attempt = 1;; ++attempt) {
                if (t->cancelled) { finish(CommandState::Failed, FailReason::Cancelled, "cancelled by caller"); break; }
                if (st.stop_requested()) { finish(CommandState::Failed, FailReason::EngineStopped, "engine stopped"); break; }
                // covers a resubmitted msg_id as well as a late ACK during backoff
                if (cachedSuccess()) break;
                if (SteadyClock::now() >= t->deadline) {
                    finish(CommandState::Failed, FailReason::DeadlineExceeded,
                        std::format("deadline of {} ms exceeded", opts.commandDeadlineMs));
                    break;
                }

                Attempt a;
                a.number = attempt;
                a.sentAt = SteadyClock::now();
                LOG_DEBUG(std::format("device {} msg {}: attempt {}/{}", cmd.deviceId, cmd.msgId, attempt, opts.maxAttempts));

                AttemptResult ar = runAttempt(lane, cmd, *t, frame);
                releaseSession(lane);

                a.outcome = ar.outcome;
                a.elapsedMs = elapsedMs(a.sentAt);
                a.detail = ar.detail;
                if (ar.sent) ++res.attempts;
                res.attemptLog.push_back(a);

                AttemptEvent ev{ cmd.msgId, cmd.deviceId, attempt, ar.outcome, a.elapsedMs, ar.sent, ar.detail };
                notify("onAttempt", [&](IRelayObserver& o) { o.onAttempt(ev); });

                if (ar.outcome == Outcome::Success) {
                    cache->record(cmd.msgId, Outcome::Success);
                    res.reportedState = ar.response->state;
                    finish(CommandState::Success, FailReason::None, {});
                    break;
                }
                if (t->cancelled) { finish(CommandState::Failed, FailReason::Cancelled, "cancelled by caller"); break; }
                if (st.stop_requested()) { finish(CommandState::Failed, FailReason::EngineStopped, "engine stopped"); break; }
                if (ar.terminal) {
                    if (ar.reason == FailReason::DeviceRejected)
                        cache->record(cmd.msgId, Outcome::Error);
                    finish(CommandState::Failed, ar.reason, ar.detail);
                    break;
                }

                // recoverable: timeouts only count as such, the last real error wins otherwise
                if (ar.outcome == Outcome::Error) lastError = ar.reason;
                lastDetail = ar.detail;

                if (cachedSuccess()) break;
                if (attempt >= opts.maxAttempts) {
                    finish(CommandState::Failed,
                        lastError == FailReason::None ? FailReason::AllAttemptsTimedOut : lastError,
                        lastDetail);
                    break;
                }

                const auto delay = backoff->nextDelay(attempt);
                LOG_INFO(std::format("device {} msg {}: attempt {} {} ({}), retrying in {} ms",
                    cmd.deviceId, cmd.msgId, attempt, toString(ar.outcome), ar.detail, delay.count()));
                notify("onRetry", [&](IRelayObserver& o) { o.onRetry(cmd.deviceId, cmd.msgId, attempt, delay); });
                waitBackoff(lane, *t, delay, st);
            }

            {
                std::scoped_lock lk(lane.mx);
                lane.activeMsgId.clear();
                lane.wake = false;
            }
            resolve(t, std::move(res));
        }

        void laneLoop(Lane& lane, std::stop_token st) {
            while (!st.stop_requested()) {
                auto cmd = lane.queue.dequeue(LANE_POLL);
                if (!cmd) {
                    if (lane.queue.closed()) break;
                    continue;
                }
                auto t = findTicket(cmd->msgId);
                if (!t || t->done) continue;
                runCommand(lane, *cmd, t, st);
            }
            dropSession(lane);
        }
    };

    /*────────────────────────────── RetryEngine ──────────────────────────────*/

    RetryEngine::RetryEngine(RelayOptions opts,
                             std::shared_ptr<ISessionFactory> factory,
                             std::shared_ptr<IdempotencyCache> cache,
                             std::shared_ptr<IRelayObserver> observer,
                             std::shared_ptr<IPayloadCodec> codec)
        : pImpl_(std::make_unique<Impl>(std::move(opts), std::move(factory), std::move(cache),
                                         std::move(observer), std::move(codec)))
    {}

    RetryEngine::~RetryEngine() {
        stop();
    }

    void RetryEngine::registerDevice(DeviceEndpoint ep) {
        if (ep.deviceId.empty())
            throw std::invalid_argument("registerDevice: empty device id");

        std::unique_lock lk(pImpl_->lanesMx);
        // stop() raises the flag before it snapshots the lanes under this mutex
        if (pImpl_->stopped)
            throw std::logic_error("registerDevice: engine is stopped");

        auto it = pImpl_->lanes.find(ep.deviceId);
        if (it != pImpl_->lanes.end()) {
            std::scoped_lock l2(it->second->mx);
            it->second->ep = std::move(ep);
            return;
        }

        const std::string id = ep.deviceId;
        LOG_INFO(std::format("device {} registered at {}:{}", id, ep.host, ep.port));
        auto lane = std::make_shared<Lane>(std::move(ep), pImpl_->opts);
        Lane* raw = lane.get();
        Impl* impl = pImpl_.get();
        lane->worker = std::jthread([impl, raw](std::stop_token st) { impl->laneLoop(*raw, st); });
        pImpl_->lanes.emplace(id, std::move(lane));
    }

    bool RetryEngine::hasDevice(const std::string& deviceId) const {
        return pImpl_->findLane(deviceId) != nullptr;
    }

    CommandHandle RetryEngine::submit(Command cmd) {
        auto& impl = *pImpl_;
        if (cmd.msgId.empty()) cmd.msgId = generateMsgId();
        if (cmd.createdAt == TimePoint{}) cmd.createdAt = SteadyClock::now();

        auto t = std::make_shared<Ticket>();
        t->cmd = cmd;
        t->submittedAt = SteadyClock::now();
        t->deadline = t->submittedAt + impl.opts.commandDeadline();
        t->future = t->promise.get_future().share();
        CommandHandle handle{ cmd.msgId, t->future };

        if (impl.stopped) {
            impl.resolve(t, failed(FailReason::EngineStopped, "engine stopped"));
            return handle;
        }

        auto lane = impl.findLane(cmd.deviceId);
        if (!lane) {
            impl.resolve(t, failed(FailReason::UnknownDevice,
                std::format("no endpoint registered for device {}", cmd.deviceId)));
            return handle;
        }

        {
            std::scoped_lock lk(impl.ticketsMx);
            auto [it, inserted] = impl.tickets.try_emplace(cmd.msgId, t);
            if (!inserted) {
                LOG_DEBUG(std::format("msg {} already in flight, returning existing handle", cmd.msgId));
                return CommandHandle{ cmd.msgId, it->second->future };
            }
        }

        LOG_DEBUG(std::format("device {} msg {}: queued {} state={}", cmd.deviceId, cmd.msgId,
            toString(cmd.opcode), cmd.desiredState));

        EnqueueResult r = lane->queue.enqueue(std::move(cmd));
        if (r.evicted) {
            if (auto old = impl.findTicket(r.evicted->msgId))
                impl.resolve(old, failed(FailReason::DroppedByOverflow, "evicted by a newer command"));
        }
        if (!r.accepted()) {
            impl.notify("onQueueRejected", [&](IRelayObserver& o) { o.onQueueRejected(t->cmd.deviceId, r.reason); });
            impl.resolve(t, failed(r.reason, std::format("queue for device {} rejected the command", t->cmd.deviceId)));
        }
        return handle;
    }

    CommandResult RetryEngine::execute(Command cmd) {
        return submit(std::move(cmd)).get();
    }

    bool RetryEngine::cancel(const std::string& msgId) {
        auto& impl = *pImpl_;
        auto t = impl.findTicket(msgId);
        if (!t || t->done) return false;

        t->cancelled = true;
        LOG_INFO(std::format("msg {}: cancel requested", msgId));

        auto lane = impl.findLane(t->cmd.deviceId);
        if (!lane) return true;

        if (lane->queue.remove(msgId)) {
            impl.resolve(t, failed(FailReason::Cancelled, "cancelled while queued"));
            return true;
        }

        std::scoped_lock lk(lane->mx);
        if (lane->activeMsgId == msgId) {
            if (lane->active) lane->active->close();
            lane->wake = true;
        }
        lane->wakeCv.notify_all();
        return true;
    }

    bool RetryEngine::ingestUnsolicited(const std::string& deviceId, const std::vector<uint8_t>& payload) {
        auto& impl = *pImpl_;
        auto rsp = impl.codec->decodeResponse(payload);
        if (!rsp) {
            LOG_WARN(std::format("device {}: undecodable unsolicited payload ({} bytes) discarded", deviceId, payload.size()));
            return false;
        }

        auto lane = impl.findLane(deviceId);
        if (!lane) {
            LOG_WARN(std::format("unsolicited response from unknown device {} discarded", deviceId));
            return false;
        }

        {
            std::scoped_lock lk(lane->mx);
            const bool correlated = !lane->activeMsgId.empty()
                && lane->activeMsgId == rsp->msgId
                && lane->activeOpcode == rsp->opcode;
            if (correlated && rsp->ack) {
                impl.cache->record(rsp->msgId, Outcome::Success);
                lane->wake = true;
                lane->wakeCv.notify_all();
                LOG_INFO(std::format("device {} msg {}: late acknowledgement recorded", deviceId, rsp->msgId));
                return true;
            }
        }

        LOG_WARN(std::format("device {}: unsolicited {} for msg {} discarded",
            deviceId, rsp->ack ? "ACK" : "NACK", rsp->msgId));
        impl.notify("onStrayResponse", [&](IRelayObserver& o) { o.onStrayResponse(deviceId, rsp->msgId); });
        return false;
    }

    void RetryEngine::stop() {
        auto& impl = *pImpl_;
        if (impl.stopped.exchange(true)) return;

        std::vector<LanePtr> all;
        {
            std::shared_lock lk(impl.lanesMx);
            for (auto& [id, lane] : impl.lanes)
                all.push_back(lane);
        }

        for (auto& lane : all) {
            for (auto& c : lane->queue.close()) {
                if (auto t = impl.findTicket(c.msgId))
                    impl.resolve(t, failed(FailReason::EngineStopped, "engine stopped before the command was sent"));
            }
            lane->worker.request_stop();
            std::scoped_lock lk(lane->mx);
            if (lane->active) lane->active->close();
            lane->wakeCv.notify_all();
        }
        for (auto& lane : all) {
            if (lane->worker.joinable())
                lane->worker.join();
        }

        std::vector<TicketPtr> rest;
        {
            std::scoped_lock lk(impl.ticketsMx);
            for (auto& [id, t] : impl.tickets)
                rest.push_back(t);
        }
        for (auto& t : rest)
            impl.resolve(t, failed(FailReason::EngineStopped, "engine stopped"));

        LOG_DEBUG(std::format("retry engine stopped ({} lanes)", all.size()));
    }

    std::size_t RetryEngine::pendingCommands() const {
        std::scoped_lock lk(pImpl_->ticketsMx);
        return pImpl_->tickets.size();
    }

    std::size_t RetryEngine::queuedCommands(const std::string& deviceId) const {
        auto lane = pImpl_->findLane(deviceId);
        return lane ? lane->queue.size() : 0;
    }

    const RelayOptions& RetryEngine::options() const {
        return pImpl_->opts;
    }

    std::shared_ptr<IdempotencyCache> RetryEngine::cache() const {
        return pImpl_->cache;
    }

}
