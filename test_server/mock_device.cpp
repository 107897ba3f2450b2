// cmdrelay_mock_device: a fake power switch speaking the cmdrelay frame protocol.
//
//   cmdrelay_mock_device --port 9000 [--device-id ID] [--drop-first N]
//                        [--delay-ms MS] [--nack] [--format json|msgpack]
//                        [--log-level LEVEL]
//
// A repeated msg_id is acknowledged from the device's own idempotency cache
// without toggling again. --drop-first N applies the first N requests but
// swallows their responses, which makes the relay retry the same msg_id.

#include "mock_device.hpp"
#include "cmdrelay/core/codec/frame_codec.hpp"
#include "cmdrelay/core/util/logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <iostream>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace cmdrelay;
using namespace cmdrelay::mock;

namespace {

    volatile std::sig_atomic_t g_interrupted = 0;
    void onSignal(int) { g_interrupted = 1; }

    void printUsage(const char* prog) {
        std::cout << "usage: " << prog << " [--port PORT] [--device-id ID] [--drop-first N]"
                     " [--delay-ms MS] [--nack] [--format json|msgpack] [--log-level LEVEL]\n";
    }

    MockConfig parseArgs(int argc, char** argv) {
        MockConfig c;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument(arg + ": missing value");
                return argv[++i];
            };
            if (arg == "--port")            c.port = static_cast<uint16_t>(std::stoul(value()));
            else if (arg == "--device-id")  c.deviceId = value();
            else if (arg == "--drop-first") c.dropFirst = static_cast<uint32_t>(std::stoul(value()));
            else if (arg == "--delay-ms")   c.delayMs = static_cast<uint32_t>(std::stoul(value()));
            else if (arg == "--nack")       c.nack = true;
            else if (arg == "--format")     c.format = payloadFormatFromString(value());
            else if (arg == "--log-level")  c.logLevel = value();
            else throw std::invalid_argument("unknown argument: " + arg);
        }
        if (c.port == 0) throw std::invalid_argument("--port must be > 0");
        return c;
    }

    bool writeAll(int fd, const std::vector<uint8_t>& buf) {
        std::size_t off = 0;
        while (off < buf.size()) {
            ssize_t n = ::send(fd, buf.data() + off, buf.size() - off, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                LOG_WARN(std::format("send failed: {}", std::strerror(errno)));
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

    void serveConnection(int fd, std::string peer, MockDevice& dev, std::stop_token st) {
        FrameCodec frames;
        std::vector<uint8_t> rx;
        uint8_t chunk[4096];

        LOG_INFO(std::format("connection from {}", peer));
        while (!st.stop_requested()) {
            pollfd p{ fd, POLLIN, 0 };
            int rc = ::poll(&p, 1, 200);
            if (rc < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR(std::format("poll: {}", std::strerror(errno)));
                break;
            }
            if (rc == 0) continue;

            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                LOG_WARN(std::format("recv from {}: {}", peer, std::strerror(errno)));
                break;
            }
            rx.insert(rx.end(), chunk, chunk + n);

            try {
                bool ok = true;
                while (ok) {
                    auto f = frames.tryDecode(rx);
                    if (!f) break;
                    rx.erase(rx.begin(), rx.begin() + static_cast<std::ptrdiff_t>(f->consumed));
                    if (auto reply = dev.handle(f->payload))
                        ok = writeAll(fd, frames.encode(*reply));
                }
                if (!ok) break;
            }
            catch (const FrameError& e) {
                LOG_WARN(std::format("closing {}: {} ({})", peer, e.what(), toString(e.code())));
                break;
            }
        }
        ::close(fd);
        LOG_INFO(std::format("connection from {} closed", peer));
    }

    int openListener(uint16_t port) {
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0)
            throw std::runtime_error(std::format("socket: {}", std::strerror(errno)));

        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(port);
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd, 16) < 0) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error(std::format("bind/listen on port {}: {}", port, std::strerror(err)));
        }
        return fd;
    }

    struct Connection {
        std::shared_ptr<std::atomic<bool>> finished;
        std::jthread worker;
    };

}

int main(int argc, char** argv) {
    MockConfig cfg;
    try {
        for (int i = 1; i < argc; ++i) {
            if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
                printUsage(argv[0]);
                return 0;
            }
        }
        cfg = parseArgs(argc, argv);
        Logger::inst().setLevel(parseLogLevel(cfg.logLevel));
    }
    catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    int lfd = -1;
    try {
        lfd = openListener(cfg.port);
    }
    catch (const std::runtime_error& e) {
        LOG_ERROR(e.what());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    MockDevice dev(cfg);
    LOG_INFO(std::format("mock device listening on :{} (format={}, drop-first={}, delay={}ms, nack={})",
        cfg.port, toString(cfg.format), cfg.dropFirst, cfg.delayMs, cfg.nack));

    std::list<Connection> conns;
    while (!g_interrupted) {
        pollfd p{ lfd, POLLIN, 0 };
        int rc = ::poll(&p, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR(std::format("poll: {}", std::strerror(errno)));
            break;
        }

        conns.remove_if([](const Connection& c) { return c.finished->load(); });
        if (rc == 0) continue;

        sockaddr_in peer{};
        socklen_t len = sizeof(peer);
        int cfd = ::accept4(lfd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (errno != EINTR && errno != EAGAIN)
                LOG_WARN(std::format("accept: {}", std::strerror(errno)));
            continue;
        }

        char ip[INET_ADDRSTRLEN]{};
        ::inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
        std::string name = std::format("{}:{}", ip, ntohs(peer.sin_port));

        auto finished = std::make_shared<std::atomic<bool>>(false);
        conns.push_back(Connection{ finished, std::jthread([cfd, name, &dev, finished](std::stop_token st) {
            serveConnection(cfd, name, dev, st);
            finished->store(true);
        }) });
    }

    LOG_INFO("mock device shutting down");
    conns.clear();
    ::close(lfd);
    return 0;
}
