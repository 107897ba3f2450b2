/**
 * @file error_types.hpp
 * @brief Error type definitions for cmdrelay.
 *
 * Framing and transport failures are raised as typed exceptions inside a single
 * attempt. Only the terminal FailReason of a command leaves the engine.
 *
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cmdrelay {

    /**
     * @enum FrameErr
     * @brief Frame decoding and encoding failures.
     *
     * - BadMagic: First two bytes are not the protocol magic (fatal for the connection)
     * - UnsupportedVersion: Version byte is not supported (fatal for the connection)
     * - TruncatedFrame: Not enough bytes buffered yet (recoverable, read more)
     * - FrameTooLarge: Payload exceeds the configured maximum
     */
    enum class FrameErr : int {
        BadMagic = 1,        ///< Wrong magic bytes
        UnsupportedVersion,  ///< Unknown version byte
        TruncatedFrame,      ///< Need more bytes
        FrameTooLarge        ///< Payload over the size cap
    };

    /**
     * @enum SessionErr
     * @brief Transport failures surfaced by a device session.
     */
    enum class SessionErr : int {
        ConnectTimeout = 1,  ///< TCP connect did not finish in time
        ConnectRefused,      ///< Peer actively refused (RST / unreachable)
        SendTimeout,         ///< Frame could not be fully written in time
        RecvTimeout,         ///< No complete frame arrived in time
        PeerClosed,          ///< Orderly or abortive close by the peer
        IOError              ///< Any other socket error
    };

    const char* toString(FrameErr e);
    const char* toString(SessionErr e);

    /**
     * @brief True only for TruncatedFrame: the caller should buffer more bytes.
     */
    constexpr bool isRecoverable(FrameErr e) { return e == FrameErr::TruncatedFrame; }

    /**
     * @class FrameError
     * @brief Thrown by FrameCodec and by sessions when the byte stream is malformed.
     */
    class FrameError : public std::runtime_error {
    public:
        FrameError(FrameErr code, const std::string& what)
            : std::runtime_error(what), code_(code) {}
        FrameErr code() const noexcept { return code_; }
    private:
        FrameErr code_;
    };

    /**
     * @class SessionError
     * @brief Thrown by IDeviceSession implementations on I/O failure or timeout.
     */
    class SessionError : public std::runtime_error {
    public:
        SessionError(SessionErr code, const std::string& what)
            : std::runtime_error(what), code_(code) {}
        SessionErr code() const noexcept { return code_; }
    private:
        SessionErr code_;
    };

}
