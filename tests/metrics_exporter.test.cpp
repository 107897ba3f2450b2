#include <catch2/catch_all.hpp>
#include <poll.h>
#include <string>
#include "cmdrelay/transports/http/metrics_exporter.hpp"
#include "loopback_peer.hpp"

using namespace cmdrelay;
using namespace cmdrelay::test;
using Catch::Matchers::ContainsSubstring;

namespace {
    struct Reply {
        std::string text;
        bool closedByServer{ false };
    };

    /// Plain HTTP/1.1 GET; reads until the server closes or two seconds pass.
    Reply httpGetKeepAlive(uint16_t port, const std::string& path) {
        Reply r;
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        a.sin_port = htons(port);
        if (::connect(fd, reinterpret_cast<sockaddr*>(&a), sizeof(a)) < 0) {
            ::close(fd);
            return r;
        }

        const std::string req = "GET " + path + " HTTP/1.1\r\nHost: localhost\r\nConnection: keep-alive\r\n\r\n";
        LoopbackPeer::writeAll(fd, { req.begin(), req.end() });

        const auto until = SteadyClock::now() + std::chrono::seconds(2);
        char buf[4096];
        while (SteadyClock::now() < until) {
            pollfd p{ fd, POLLIN, 0 };
            if (::poll(&p, 1, 100) <= 0) continue;
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                r.closedByServer = true;
                break;
            }
            r.text.append(buf, static_cast<std::size_t>(n));
        }
        ::close(fd);
        return r;
    }

    /// Plain HTTP/1.1 GET; reads until @p until shows up or two seconds pass.
    std::string httpGet(uint16_t port, const std::string& path, const std::string& until) {
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        a.sin_port = htons(port);
        if (::connect(fd, reinterpret_cast<sockaddr*>(&a), sizeof(a)) < 0) {
            ::close(fd);
            return {};
        }

        const std::string req = "GET " + path + " HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n";
        LoopbackPeer::writeAll(fd, { req.begin(), req.end() });

        std::string out;
        const auto until_ = SteadyClock::now() + std::chrono::seconds(2);
        char buf[4096];
        while (out.find(until) == std::string::npos && SteadyClock::now() < until_) {
            pollfd p{ fd, POLLIN, 0 };
            if (::poll(&p, 1, 100) <= 0) continue;
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            out.append(buf, static_cast<std::size_t>(n));
        }
        ::close(fd);
        return out;
    }
}

TEST_CASE("MetricsExporter: serves the registry over HTTP", "[metrics][http]") {
    auto reg = std::make_shared<MetricsRegistry>();
    reg->onRetry("lamp", "m1", 1, std::chrono::milliseconds(10));

    MetricsExporter exp(reg);
    const uint16_t port = closedPort();
    exp.start(port);
    REQUIRE(exp.running());
    REQUIRE(exp.port() == port);

    auto metrics = httpGet(port, "/metrics", "cmdrelay_retries_total{device_id=\"lamp\"} 1");
    REQUIRE_THAT(metrics, ContainsSubstring("200 OK"));
    REQUIRE_THAT(metrics, ContainsSubstring("text/plain; version=0.0.4"));
    REQUIRE_THAT(metrics, ContainsSubstring("cmdrelay_retries_total{device_id=\"lamp\"} 1"));

    REQUIRE_THAT(httpGet(port, "/healthz", "ok"), ContainsSubstring("ok"));
    REQUIRE_THAT(httpGet(port, "/nope", "not found"), ContainsSubstring("404"));

    REQUIRE_THROWS_AS(exp.start(port), std::runtime_error);

    exp.stop();
    REQUIRE_FALSE(exp.running());
    REQUIRE_NOTHROW(exp.stop());
}

TEST_CASE("MetricsExporter: requires a registry", "[metrics][http]") {
    REQUIRE_THROWS_AS(MetricsExporter(nullptr), std::invalid_argument);
}

TEST_CASE("MetricsExporter: keep-alive scrapers do not hold up stop", "[metrics][http]") {
    auto reg = std::make_shared<MetricsRegistry>();
    MetricsExporter exp(reg);
    const uint16_t port = closedPort();
    exp.start(port);

    auto reply = httpGetKeepAlive(port, "/healthz");
    REQUIRE_THAT(reply.text, ContainsSubstring("ok"));
    REQUIRE(reply.closedByServer);

    const auto start = SteadyClock::now();
    exp.stop();
    REQUIRE(SteadyClock::now() - start < std::chrono::seconds(2));
    REQUIRE_FALSE(exp.running());
}
