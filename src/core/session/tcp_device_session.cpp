#include "cmdrelay/core/session/tcp_device_session.hpp"
#include "cmdrelay/core/util/hex.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include "cmdrelay/core/util/time.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace cmdrelay {

    namespace {
        constexpr std::size_t READ_CHUNK = 4096;

        std::string errnoText(int err) {
            return std::format("{} (errno {})", std::strerror(err), err);
        }

        SessionErr classifyConnectErrno(int err) {
            switch (err) {
                case ECONNREFUSED:
                case EHOSTUNREACH:
                case ENETUNREACH:
                    return SessionErr::ConnectRefused;
                case ETIMEDOUT:
                    return SessionErr::ConnectTimeout;
                default:
                    return SessionErr::IOError;
            }
        }
    }

    const char* toString(SessionState s) {
        switch (s) {
            case SessionState::Disconnected: return "DISCONNECTED";
            case SessionState::Connecting:   return "CONNECTING";
            case SessionState::Connected:    return "CONNECTED";
            case SessionState::Sending:      return "SENDING";
            case SessionState::Receiving:    return "RECEIVING";
            case SessionState::Closing:      return "CLOSING";
        }
        return "UNKNOWN";
    }

    TcpDeviceSession::TcpDeviceSession(DeviceEndpoint ep, std::size_t maxPayload)
        : ep_(std::move(ep)), codec_(maxPayload)
    {
        if (::pipe2(wake_, O_NONBLOCK | O_CLOEXEC) != 0)
            throw SessionError(SessionErr::IOError, "pipe2: " + errnoText(errno));
    }

    TcpDeviceSession::~TcpDeviceSession() {
        std::scoped_lock lk(fdMx_);
        closeFdLocked();
        for (int& w : wake_) {
            if (w >= 0) ::close(w);
            w = -1;
        }
    }

    void TcpDeviceSession::setStateListener(StateListener l) {
        std::scoped_lock lk(listenerMx_);
        listener_ = std::move(l);
    }

    void TcpDeviceSession::transition(SessionState to) {
        const SessionState from = state_.exchange(to);
        if (from == to) return;

        LOG_TRACE(std::format("session {}: {} -> {}", ep_.deviceId, toString(from), toString(to)));

        StateListener l;
        {
            std::scoped_lock lk(listenerMx_);
            l = listener_;
        }
        if (l) l(from, to);
    }

    void TcpDeviceSession::closeFdLocked() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void TcpDeviceSession::beginIo() {
        std::scoped_lock lk(fdMx_);
        if (closing_)
            throw SessionError(SessionErr::IOError, "session closed");
        ioActive_ = true;
    }

    void TcpDeviceSession::endIo() {
        bool closed = false;
        {
            std::scoped_lock lk(fdMx_);
            ioActive_ = false;
            closed = closing_;
            if (closed) closeFdLocked();
        }
        if (closed) transition(SessionState::Disconnected);
    }

    void TcpDeviceSession::fail(SessionErr code, const std::string& what) {
        {
            std::scoped_lock lk(fdMx_);
            closeFdLocked();
        }
        rx_.clear();
        transition(SessionState::Disconnected);
        LOG_DEBUG(std::format("session {}: {}: {}", ep_.deviceId, toString(code), what));
        throw SessionError(code, what);
    }

    void TcpDeviceSession::failFrame(const FrameError& e) {
        {
            std::scoped_lock lk(fdMx_);
            closeFdLocked();
        }
        LOG_WARN(std::format("session {}: malformed frame ({}): {}", ep_.deviceId, toString(e.code()), e.what()));
        LOG_DEBUG(std::format("session {}: rx buffer {}", ep_.deviceId, hexDump(rx_)));
        rx_.clear();
        transition(SessionState::Disconnected);
        throw e;
    }

    bool TcpDeviceSession::waitFor(short events, std::chrono::milliseconds timeout, const char* phase) {
        const auto deadline = SteadyClock::now() + timeout;
        for (;;) {
            if (closing_)
                fail(SessionErr::IOError, std::format("{} aborted: session closed", phase));

            pollfd fds[2]{};
            fds[0].fd = fd_;
            fds[0].events = events;
            fds[1].fd = wake_[0];
            fds[1].events = POLLIN;

            const auto left = remaining(deadline);
            const int rc = ::poll(fds, 2, static_cast<int>(left.count()));
            if (rc < 0) {
                if (errno == EINTR) continue;
                fail(SessionErr::IOError, std::format("{}: poll: {}", phase, errnoText(errno)));
            }
            if ((fds[1].revents & POLLIN) || closing_)
                fail(SessionErr::IOError, std::format("{} aborted: session closed", phase));
            if (fds[0].revents != 0)
                return true;
            if (remaining(deadline).count() == 0)
                return false;
        }
    }

    void TcpDeviceSession::connect(std::chrono::milliseconds timeout) {
        if (state() == SessionState::Connected) return;
        if (state() != SessionState::Disconnected)
            throw SessionError(SessionErr::IOError,
                std::format("connect in state {}", toString(state())));

        beginIo();
        struct IoGuard { TcpDeviceSession& s; ~IoGuard() { s.endIo(); } } guard{ *this };

        transition(SessionState::Connecting);
        const auto deadline = SteadyClock::now() + timeout;

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        const std::string port = std::to_string(ep_.port);

        const int gai = ::getaddrinfo(ep_.host.c_str(), port.c_str(), &hints, &res);
        if (gai != 0)
            fail(SessionErr::IOError, std::format("resolve {}: {}", ep_.host, ::gai_strerror(gai)));
        std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> resGuard(res, &::freeaddrinfo);

        SessionErr lastCode = SessionErr::ConnectRefused;
        std::string lastWhat = std::format("no usable address for {}", ep_.host);

        for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
            const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) {
                lastCode = SessionErr::IOError;
                lastWhat = "socket: " + errnoText(errno);
                continue;
            }
            {
                std::scoped_lock lk(fdMx_);
                fd_ = fd;
            }

            int err = 0;
            if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) != 0)
                err = errno;

            if (err == EINPROGRESS) {
                if (!waitFor(POLLOUT, remaining(deadline), "connect")) {
                    fail(SessionErr::ConnectTimeout,
                        std::format("connect to {}:{} timed out after {} ms", ep_.host, ep_.port, timeout.count()));
                }
                socklen_t len = sizeof(err);
                if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
                    err = errno;
            }

            if (err == 0) {
                int one = 1;
                if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0)
                    LOG_DEBUG(std::format("session {}: TCP_NODELAY: {}", ep_.deviceId, errnoText(errno)));
                transition(SessionState::Connected);
                LOG_DEBUG(std::format("session {}: connected to {}:{}", ep_.deviceId, ep_.host, ep_.port));
                return;
            }

            {
                std::scoped_lock lk(fdMx_);
                closeFdLocked();
            }
            lastCode = classifyConnectErrno(err);
            lastWhat = std::format("connect to {}:{}: {}", ep_.host, ep_.port, errnoText(err));

            if (remaining(deadline).count() == 0) break;
        }

        fail(lastCode, lastWhat);
    }

    void TcpDeviceSession::send(const std::vector<uint8_t>& frame, std::chrono::milliseconds timeout) {
        if (state() != SessionState::Connected)
            throw SessionError(SessionErr::IOError,
                std::format("send in state {}", toString(state())));

        beginIo();
        struct IoGuard { TcpDeviceSession& s; ~IoGuard() { s.endIo(); } } guard{ *this };

        transition(SessionState::Sending);
        LOG_TRACE(std::format("session {} tx [{}]", ep_.deviceId, hexDump(frame)));

        const auto deadline = SteadyClock::now() + timeout;
        std::size_t off = 0;
        while (off < frame.size()) {
            const ssize_t n = ::send(fd_, frame.data() + off, frame.size() - off, MSG_NOSIGNAL);
            if (n > 0) {
                off += static_cast<std::size_t>(n);
                continue;
            }
            if (n == 0)
                fail(SessionErr::IOError, "send wrote 0 bytes");

            const int err = errno;
            if (err == EINTR) continue;
            if (err == EAGAIN || err == EWOULDBLOCK) {
                if (!waitFor(POLLOUT, remaining(deadline), "send")) {
                    fail(SessionErr::SendTimeout,
                        std::format("send of {} bytes timed out after {} ms ({} written)", frame.size(), timeout.count(), off));
                }
                continue;
            }
            if (err == EPIPE || err == ECONNRESET)
                fail(SessionErr::PeerClosed, "send: " + errnoText(err));
            fail(SessionErr::IOError, "send: " + errnoText(err));
        }

        transition(SessionState::Connected);
    }

    std::vector<uint8_t> TcpDeviceSession::receive(std::chrono::milliseconds timeout) {
        if (state() != SessionState::Connected)
            throw SessionError(SessionErr::IOError,
                std::format("receive in state {}", toString(state())));

        beginIo();
        struct IoGuard { TcpDeviceSession& s; ~IoGuard() { s.endIo(); } } guard{ *this };

        transition(SessionState::Receiving);
        const auto deadline = SteadyClock::now() + timeout;
        uint8_t buf[READ_CHUNK];

        for (;;) {
            std::optional<DecodedFrame> f;
            try {
                f = codec_.tryDecode(rx_);
            }
            catch (const FrameError& e) {
                failFrame(e);
            }
            if (f) {
                rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(f->consumed));
                transition(SessionState::Connected);
                LOG_TRACE(std::format("session {} rx {} payload bytes", ep_.deviceId, f->payload.size()));
                return std::move(f->payload);
            }

            if (!waitFor(POLLIN, remaining(deadline), "receive"))
                fail(SessionErr::RecvTimeout, std::format("no response within {} ms", timeout.count()));

            // never buffer more than the largest frame we would accept
            const std::size_t room = codec_.maxFrameSize() - rx_.size();
            const ssize_t n = ::recv(fd_, buf, std::min(room, sizeof(buf)), 0);
            if (n > 0) {
                rx_.insert(rx_.end(), buf, buf + n);
                continue;
            }
            if (n == 0)
                fail(SessionErr::PeerClosed, "peer closed the connection");

            const int err = errno;
            if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK) continue;
            if (err == ECONNRESET)
                fail(SessionErr::PeerClosed, "recv: " + errnoText(err));
            fail(SessionErr::IOError, "recv: " + errnoText(err));
        }
    }

    void TcpDeviceSession::close() {
        bool active = false;
        {
            std::scoped_lock lk(fdMx_);
            if (closing_.exchange(true)) return;
            active = ioActive_;
            if (state() != SessionState::Disconnected)
                transition(SessionState::Closing);
            if (active) {
                if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
                const uint8_t b = 1;
                if (::write(wake_[1], &b, 1) < 0 && errno != EAGAIN)
                    LOG_WARN(std::format("session {}: wake pipe: {}", ep_.deviceId, errnoText(errno)));
            }
            else {
                closeFdLocked();
            }
        }

        // an active operation finishes the transition when it unwinds
        if (!active) transition(SessionState::Disconnected);
    }

    void TcpDeviceSession::reset() {
        {
            std::scoped_lock lk(fdMx_);
            closeFdLocked();
            uint8_t drain[64];
            while (::read(wake_[0], drain, sizeof(drain)) > 0) {}
            closing_ = false;
        }
        rx_.clear();
        transition(SessionState::Disconnected);
    }

}
