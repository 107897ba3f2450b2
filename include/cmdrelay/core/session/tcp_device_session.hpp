/**
 * @file tcp_device_session.hpp
 * @brief IDeviceSession over a plain TCP socket.
 *
 * Non-blocking socket plus poll() for every suspension point, so each
 * operation honours its timeout. A self-pipe lets close() from another thread
 * wake a blocked poll.
 *
 * @date 2025
 */
#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include "cmdrelay/core/interfaces/idevice_session.hpp"
#include "cmdrelay/core/codec/frame_codec.hpp"

namespace cmdrelay {

    /**
     * @class TcpDeviceSession
     * @brief One TCP connection to one device.
     */
    class TcpDeviceSession : public IDeviceSession {
    public:
        using StateListener = std::function<void(SessionState from, SessionState to)>;

        /**
         * @param ep Device address
         * @param maxPayload Read cap; a peer announcing a larger frame is rejected with FrameTooLarge
         */
        TcpDeviceSession(DeviceEndpoint ep, std::size_t maxPayload = frame::DEFAULT_MAX_PAYLOAD);
        ~TcpDeviceSession() override;

        TcpDeviceSession(const TcpDeviceSession&) = delete;
        TcpDeviceSession& operator=(const TcpDeviceSession&) = delete;

        void connect(std::chrono::milliseconds timeout) override;
        void send(const std::vector<uint8_t>& frame, std::chrono::milliseconds timeout) override;
        std::vector<uint8_t> receive(std::chrono::milliseconds timeout) override;
        void close() override;
        void reset() override;
        SessionState state() const override { return state_.load(); }

        /**
         * @brief Observe state transitions (debug logging, tests).
         */
        void setStateListener(StateListener l);

        const DeviceEndpoint& endpoint() const { return ep_; }

        /**
         * @brief Bytes read but not yet consumed by a decoded frame.
         */
        std::size_t bufferedBytes() const { return rx_.size(); }

    private:
        void transition(SessionState to);
        [[noreturn]] void fail(SessionErr code, const std::string& what);
        [[noreturn]] void failFrame(const FrameError& e);
        void closeFdLocked();
        void beginIo();
        void endIo();

        /// poll() for @p events on the socket or the wake pipe; false on timeout
        bool waitFor(short events, std::chrono::milliseconds timeout, const char* phase);

        DeviceEndpoint ep_;
        FrameCodec codec_;

        int fd_{ -1 };
        int wake_[2]{ -1, -1 };
        std::atomic<bool> closing_{ false };
        bool ioActive_{ false };    ///< owning thread is inside connect/send/receive, guarded by fdMx_
        std::atomic<SessionState> state_{ SessionState::Disconnected };

        std::vector<uint8_t> rx_;

        std::mutex fdMx_;           ///< guards fd_ and wake_ against close() from another thread
        std::mutex listenerMx_;
        StateListener listener_;
    };

    /**
     * @class TcpSessionFactory
     * @brief Creates TcpDeviceSession instances with a fixed read cap.
     */
    class TcpSessionFactory : public ISessionFactory {
    public:
        explicit TcpSessionFactory(std::size_t maxPayload = frame::DEFAULT_MAX_PAYLOAD)
            : maxPayload_(maxPayload) {}

        std::unique_ptr<IDeviceSession> create(const DeviceEndpoint& ep) override {
            return std::make_unique<TcpDeviceSession>(ep, maxPayload_);
        }

    private:
        std::size_t maxPayload_;
    };

}
