/**
 * @file retry_engine.hpp
 * @brief Request/response correlation and retry state machine.
 *
 * Per command:
 *
 *     CREATED -> QUEUED -> SENT -> AWAITING_RESPONSE -> { SUCCESS | RETRY | FAILED }
 *     RETRY -> SENT (same frame, same msg_id)
 *
 * Every registered device gets a lane: a bounded CommandQueue and one worker
 * thread, so at most one command per device is on the wire while different
 * devices proceed in parallel. Before every re-send the lane consults the
 * IdempotencyCache; a SUCCESS recorded by a late response ends the command
 * without transmitting again.
 *
 * @date 2025
 */
#pragma once
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "cmdrelay/core/types.hpp"
#include "cmdrelay/core/options.hpp"
#include "cmdrelay/core/cache/idempotency_cache.hpp"
#include "cmdrelay/core/interfaces/idevice_session.hpp"
#include "cmdrelay/core/interfaces/ipayload_codec.hpp"
#include "cmdrelay/core/interfaces/irelay_observer.hpp"

namespace cmdrelay {

    /**
     * @struct CommandHandle
     * @brief Returned by submit(); the future resolves exactly once with the terminal result.
     */
    struct CommandHandle {
        std::string msgId;
        std::shared_future<CommandResult> result;

        CommandResult get() const { return result.get(); }
        bool ready() const {
            return result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }
    };

    /**
     * @class RetryEngine
     * @brief Drives commands to a terminal outcome over device sessions.
     */
    class RetryEngine {
    public:
        /**
         * @param opts Validated in the constructor (throws std::invalid_argument)
         * @param factory Creates a session per connection attempt
         * @param cache Shared idempotency store; one is created from opts when null
         * @param observer Optional event sink
         * @param codec Payload codec; built from opts.payloadFormat when null
         */
        RetryEngine(RelayOptions opts,
                    std::shared_ptr<ISessionFactory> factory,
                    std::shared_ptr<IdempotencyCache> cache = nullptr,
                    std::shared_ptr<IRelayObserver> observer = nullptr,
                    std::shared_ptr<IPayloadCodec> codec = nullptr);

        /**
         * @brief Calls stop().
         */
        ~RetryEngine();

        RetryEngine(const RetryEngine&) = delete;
        RetryEngine& operator=(const RetryEngine&) = delete;

        /**
         * @brief Make a device addressable and start its lane.
         *
         * Registering an existing device id updates its endpoint for future connections.
         */
        void registerDevice(DeviceEndpoint ep);
        bool hasDevice(const std::string& deviceId) const;

        /**
         * @brief Hand a command to its device lane.
         *
         * An empty msgId is filled in. Submitting a msg_id that is still in
         * flight returns the existing handle. With BlockWithTimeout this call may
         * wait for queue room.
         */
        CommandHandle submit(Command cmd);

        /**
         * @brief submit() and wait for the terminal result.
         */
        CommandResult execute(Command cmd);

        /**
         * @brief Cancel a queued or in-flight command.
         * @return false if the msg_id is unknown or already terminal
         */
        bool cancel(const std::string& msgId);

        /**
         * @brief Feed a response payload that arrived outside an attempt.
         *
         * An ACK matching the device's in-flight command records SUCCESS and
         * wakes a pending retry so it completes without re-sending.
         * @return true if the payload was correlated
         */
        bool ingestUnsolicited(const std::string& deviceId, const std::vector<uint8_t>& payload);

        /**
         * @brief Fail everything still pending with EngineStopped and join the lanes. Idempotent.
         */
        void stop();

        std::size_t pendingCommands() const;
        std::size_t queuedCommands(const std::string& deviceId) const;

        const RelayOptions& options() const;
        std::shared_ptr<IdempotencyCache> cache() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
