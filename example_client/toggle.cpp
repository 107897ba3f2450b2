// cmdrelay_toggle: send one toggle command to a device and exit with its outcome.
//
//   0  SUCCESS
//   1  FAILED (reason printed)
//   2  usage or configuration error

#include "cmdrelay/cmdrelay.hpp"
#include "cmdrelay/transports/http/metrics_exporter.hpp"
#include "utils/args.hpp"

#include <format>
#include <iostream>
#include <memory>

using namespace cmdrelay;

namespace {

    void setupLogging(const cli::ToggleArgs& a) {
        Logger::inst().setLevel(parseLogLevel(a.logLevel));
        Logger::inst().setSink(a.logFormat == "json" ? Logger::makeJsonSink(std::cout) : Logger::makeTextSink());
    }

    RelayOptions buildOptions(const cli::ToggleArgs& a) {
        RelayOptions opts;
        if (!a.configPath.empty())
            opts = loadOptionsFile(a.configPath, opts);
        if (a.maxAttempts)
            opts.maxAttempts = *a.maxAttempts;
        if (a.reuseConnection)
            opts.reuseConnection = true;
        opts.validate();
        return opts;
    }

}

int main(int argc, char** argv) {
    cli::ToggleArgs args;
    RelayOptions opts;
    try {
        args = cli::parseArgs(argc, argv);
        if (args.help) {
            std::cout << cli::usage(argv[0]);
            return 0;
        }
        setupLogging(args);
        opts = buildOptions(args);
    }
    catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n\n" << cli::usage(argv[0]);
        return 2;
    }

    auto cache = std::make_shared<IdempotencyCache>(opts.cacheCapacity, opts.cacheTtl());
    auto registry = std::make_shared<MetricsRegistry>();
    registry->attachCache(cache);
    auto observer = std::make_shared<AsyncObserver>(registry);

    MetricsExporter exporter(registry);
    if (args.metricsPort != 0) {
        try {
            exporter.start(args.metricsPort);
        }
        catch (const std::runtime_error& e) {
            LOG_WARN(std::string("metrics disabled: ") + e.what());
        }
    }

    CommandResult res;
    {
        RetryEngine engine(opts, std::make_shared<TcpSessionFactory>(opts.maxFrameBytes), cache, observer);
        engine.registerDevice(DeviceEndpoint{ args.deviceId, args.deviceHost, args.devicePort });

        Command cmd = makeCommand(args.deviceId, Opcode::Toggle, args.state);
        LOG_INFO(std::format("toggle device {} at {}:{} -> {} (msg {}, max attempts {})",
            args.deviceId, args.deviceHost, args.devicePort, args.state ? "on" : "off",
            cmd.msgId, opts.maxAttempts));

        res = engine.execute(std::move(cmd));
        engine.stop();
    }
    observer->shutdown();
    if (observer->dropped() > 0)
        LOG_WARN(std::format("{} observability event(s) dropped", observer->dropped()));
    exporter.stop();

    if (res.ok()) {
        std::cerr << std::format("SUCCESS msg_id={} attempts={} elapsed_ms={:.1f}{}\n",
            res.msgId, res.attempts, res.totalMs,
            res.reportedState ? std::format(" state={}", *res.reportedState ? "on" : "off") : "");
        return 0;
    }

    std::cerr << std::format("FAILED({}) msg_id={} attempts={} elapsed_ms={:.1f}: {}\n",
        toString(res.reason), res.msgId, res.attempts, res.totalMs, res.detail);
    return 1;
}
