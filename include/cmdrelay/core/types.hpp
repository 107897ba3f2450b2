/**
 * @file types.hpp
 * @brief Core value types shared by the queue, the cache and the retry engine.
 *
 * @date 2025
 */
#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include "cmdrelay/core/util/time.hpp"

namespace cmdrelay {

    /**
     * @enum Opcode
     * @brief Operations a device understands.
     */
    enum class Opcode : uint8_t {
        Toggle,     ///< Set the device power state to desiredState
        Query       ///< Ask for the current state (desiredState ignored)
    };

    const char* toString(Opcode op);
    /**
     * @brief Parse a wire opcode ("toggle", "query").
     */
    std::optional<Opcode> opcodeFromString(std::string_view s);

    /**
     * @enum CommandState
     * @brief Per-command lifecycle states.
     */
    enum class CommandState : uint8_t {
        Created,
        Queued,
        Sent,
        AwaitingResponse,
        Retry,
        Success,
        Failed
    };

    const char* toString(CommandState s);
    constexpr bool isTerminal(CommandState s) {
        return s == CommandState::Success || s == CommandState::Failed;
    }

    /**
     * @enum FailReason
     * @brief Why a command ended in FAILED.
     */
    enum class FailReason : uint8_t {
        None = 0,
        QueueFull,            ///< Rejected at enqueue by reject-new
        QueueTimeout,         ///< block-with-timeout found no room in time
        DroppedByOverflow,    ///< Evicted from the head by drop-oldest
        Cancelled,            ///< Caller cancelled it
        AllAttemptsTimedOut,  ///< Every attempt ended in a timeout
        ConnectRefused,       ///< Last attempt was refused
        PeerClosed,           ///< Last attempt lost the connection
        SendFailed,           ///< Last attempt could not write the frame in time
        IOError,              ///< Unrecoverable socket error
        BadMagic,             ///< Peer sent a frame with wrong magic
        UnsupportedVersion,   ///< Peer sent an unknown frame version
        FrameTooLarge,        ///< Request or response over the size cap
        DeviceRejected,       ///< Device answered with a NACK
        DeadlineExceeded,     ///< Overall command deadline passed
        UnknownDevice,        ///< No endpoint registered for device_id
        InvalidCommand,       ///< Request cannot be encoded, or its msg_id would not survive the codec
        EngineStopped         ///< Engine shut down before the command finished
    };

    const char* toString(FailReason r);

    /**
     * @enum Outcome
     * @brief Result of one attempt; also the value stored by the idempotency cache.
     */
    enum class Outcome : uint8_t {
        Pending,
        Success,
        Timeout,
        Error
    };

    const char* toString(Outcome o);

    /**
     * @struct Command
     * @brief A caller-issued intent. msgId is assigned once and reused by every attempt.
     */
    struct Command {
        std::string deviceId;
        Opcode      opcode{ Opcode::Toggle };
        bool        desiredState{ false };
        std::string msgId;          ///< 32 hex chars, the idempotency key
        TimePoint   createdAt{};
    };

    /**
     * @brief Create a command with a fresh random msg_id.
     */
    Command makeCommand(std::string deviceId, Opcode op, bool desiredState);

    /**
     * @brief 32 lowercase hex characters from 16 random bytes.
     */
    std::string generateMsgId();

    /**
     * @struct Attempt
     * @brief One transmission of a command.
     */
    struct Attempt {
        uint32_t  number{ 0 };      ///< 1-based
        TimePoint sentAt{};
        Outcome   outcome{ Outcome::Pending };
        double    elapsedMs{ 0.0 };
        std::string detail;         ///< error text for Timeout / Error
    };

    /**
     * @struct CommandResult
     * @brief Terminal outcome handed back to the caller.
     */
    struct CommandResult {
        std::string msgId;
        std::string deviceId;
        CommandState state{ CommandState::Failed };
        FailReason   reason{ FailReason::None };
        uint32_t     attempts{ 0 };         ///< frames actually transmitted
        std::vector<Attempt> attemptLog;
        std::optional<bool> reportedState;  ///< state echoed by the device, if any
        std::string  detail;
        double       totalMs{ 0.0 };

        bool ok() const { return state == CommandState::Success; }
    };

    /**
     * @struct DeviceEndpoint
     * @brief Where a device lives on the network.
     */
    struct DeviceEndpoint {
        std::string deviceId;
        std::string host;
        uint16_t    port{ 9000 };
    };

    /**
     * @struct DeviceRequest
     * @brief Decoded request payload (device side view of a Command).
     */
    struct DeviceRequest {
        Opcode      opcode{ Opcode::Toggle };
        std::string deviceId;
        std::string msgId;
        bool        state{ false };
    };

    /**
     * @struct DeviceResponse
     * @brief Decoded response payload. ack=false is an explicit NACK.
     */
    struct DeviceResponse {
        Opcode      opcode{ Opcode::Toggle };
        std::string deviceId;
        std::string msgId;
        bool        ack{ false };
        std::optional<bool> state;
        std::string error;
    };

}
