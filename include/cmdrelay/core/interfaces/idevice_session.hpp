/**
 * @file idevice_session.hpp
 * @brief Interface for one connection to one device.
 *
 * State machine:
 *
 *     DISCONNECTED -> CONNECTING -> CONNECTED -> (SENDING <-> RECEIVING) -> CLOSING -> DISCONNECTED
 *
 * Any timeout or I/O error moves the session straight to DISCONNECTED and is
 * raised as a SessionError (or FrameError for a malformed byte stream). A
 * session never reconnects on its own; the retry engine calls reset() and
 * connect() again, or asks the factory for a fresh session.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>
#include "cmdrelay/core/types.hpp"

namespace cmdrelay {

    /**
     * @enum SessionState
     * @brief Connection lifecycle states.
     */
    enum class SessionState : uint8_t {
        Disconnected,
        Connecting,
        Connected,
        Sending,
        Receiving,
        Closing
    };

    const char* toString(SessionState s);

    /**
     * @class IDeviceSession
     * @brief Owns one transport connection and moves whole frames over it.
     *
     * connect/send/receive are called from a single thread (the device lane).
     * close() may be called from any thread and unblocks a pending operation.
     */
    class IDeviceSession {
    public:
        virtual ~IDeviceSession() = default;

        /**
         * @brief Open the connection.
         * @throws SessionError(ConnectTimeout | ConnectRefused | IOError)
         */
        virtual void connect(std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Write a complete encoded frame.
         * @throws SessionError(SendTimeout | PeerClosed | IOError)
         */
        virtual void send(const std::vector<uint8_t>& frame, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Wait for one complete frame and return its payload.
         *
         * Bytes following the frame stay buffered for the next call.
         * @throws SessionError(RecvTimeout | PeerClosed | IOError)
         * @throws FrameError(BadMagic | UnsupportedVersion | FrameTooLarge)
         */
        virtual std::vector<uint8_t> receive(std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Close the connection. Thread-safe and idempotent.
         */
        virtual void close() = 0;

        /**
         * @brief Drop any buffered bytes and return to DISCONNECTED so connect() may be called again.
         */
        virtual void reset() = 0;

        virtual SessionState state() const = 0;

        bool isConnected() const { return state() == SessionState::Connected; }
    };

    /**
     * @class ISessionFactory
     * @brief Creates sessions for registered devices.
     */
    class ISessionFactory {
    public:
        virtual ~ISessionFactory() = default;
        virtual std::unique_ptr<IDeviceSession> create(const DeviceEndpoint& ep) = 0;
    };

}
