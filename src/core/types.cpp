#include "cmdrelay/core/types.hpp"
#include "cmdrelay/core/util/error_types.hpp"
#include "cmdrelay/core/util/hex.hpp"
#include "internal/core/util/random.hpp"

namespace cmdrelay {

    const char* toString(Opcode op) {
        switch (op) {
            case Opcode::Toggle: return "toggle";
            case Opcode::Query:  return "query";
        }
        return "unknown";
    }

    std::optional<Opcode> opcodeFromString(std::string_view s) {
        if (s == "toggle") return Opcode::Toggle;
        if (s == "query")  return Opcode::Query;
        return std::nullopt;
    }

    const char* toString(CommandState s) {
        switch (s) {
            case CommandState::Created:          return "CREATED";
            case CommandState::Queued:           return "QUEUED";
            case CommandState::Sent:             return "SENT";
            case CommandState::AwaitingResponse: return "AWAITING_RESPONSE";
            case CommandState::Retry:            return "RETRY";
            case CommandState::Success:          return "SUCCESS";
            case CommandState::Failed:           return "FAILED";
        }
        return "UNKNOWN";
    }

    const char* toString(FailReason r) {
        switch (r) {
            case FailReason::None:                return "None";
            case FailReason::QueueFull:           return "QueueFull";
            case FailReason::QueueTimeout:        return "QueueTimeout";
            case FailReason::DroppedByOverflow:   return "DroppedByOverflow";
            case FailReason::Cancelled:           return "Cancelled";
            case FailReason::AllAttemptsTimedOut: return "AllAttemptsTimedOut";
            case FailReason::ConnectRefused:      return "ConnectRefused";
            case FailReason::PeerClosed:          return "PeerClosed";
            case FailReason::SendFailed:          return "SendFailed";
            case FailReason::IOError:             return "IOError";
            case FailReason::BadMagic:            return "BadMagic";
            case FailReason::UnsupportedVersion:  return "UnsupportedVersion";
            case FailReason::FrameTooLarge:       return "FrameTooLarge";
            case FailReason::DeviceRejected:      return "DeviceRejected";
            case FailReason::DeadlineExceeded:    return "DeadlineExceeded";
            case FailReason::UnknownDevice:       return "UnknownDevice";
            case FailReason::InvalidCommand:      return "InvalidCommand";
            case FailReason::EngineStopped:       return "EngineStopped";
        }
        return "Unknown";
    }

    const char* toString(Outcome o) {
        switch (o) {
            case Outcome::Pending: return "pending";
            case Outcome::Success: return "success";
            case Outcome::Timeout: return "timeout";
            case Outcome::Error:   return "error";
        }
        return "unknown";
    }

    const char* toString(FrameErr e) {
        switch (e) {
            case FrameErr::BadMagic:           return "BadMagic";
            case FrameErr::UnsupportedVersion: return "UnsupportedVersion";
            case FrameErr::TruncatedFrame:     return "TruncatedFrame";
            case FrameErr::FrameTooLarge:      return "FrameTooLarge";
        }
        return "Unknown";
    }

    const char* toString(SessionErr e) {
        switch (e) {
            case SessionErr::ConnectTimeout: return "ConnectTimeout";
            case SessionErr::ConnectRefused: return "ConnectRefused";
            case SessionErr::SendTimeout:    return "SendTimeout";
            case SessionErr::RecvTimeout:    return "RecvTimeout";
            case SessionErr::PeerClosed:     return "PeerClosed";
            case SessionErr::IOError:        return "IOError";
        }
        return "Unknown";
    }

    std::string generateMsgId() {
        std::array<uint8_t, 16> raw{};
        randomFill(raw);
        return toHex(raw);
    }

    Command makeCommand(std::string deviceId, Opcode op, bool desiredState) {
        Command c;
        c.deviceId = std::move(deviceId);
        c.opcode = op;
        c.desiredState = desiredState;
        c.msgId = generateMsgId();
        c.createdAt = SteadyClock::now();
        return c;
    }

}
