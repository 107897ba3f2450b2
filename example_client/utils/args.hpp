#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cmdrelay::cli {

    class ArgError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ToggleArgs {
        std::string deviceId;
        std::string deviceHost;
        uint16_t    devicePort{ 9000 };
        bool        state{ true };
        std::optional<uint32_t> maxAttempts;    ///< overrides the config file when given
        std::string logLevel{ "info" };
        std::string logFormat{ "json" };
        uint16_t    metricsPort{ 9400 };        ///< 0 disables the exporter
        std::string configPath;
        bool        reuseConnection{ false };
        bool        help{ false };
    };

    inline std::string usage(std::string_view prog) {
        std::string u;
        u += "usage: ";
        u += prog;
        u += " --device-id ID --device-host HOST [options]\n"
             "\n"
             "  --device-id ID          device identifier (required)\n"
             "  --device-host HOST      device address (required)\n"
             "  --device-port PORT      device TCP port (default 9000)\n"
             "  --state on|off          desired power state (default on)\n"
             "  --max-attempts N        attempts including the first (default 2)\n"
             "  --log-level LEVEL       trace|debug|info|warn|error (default info)\n"
             "  --log-format FORMAT     json|text (default json)\n"
             "  --metrics-port PORT     Prometheus exporter port, 0 disables (default 9400)\n"
             "  --config FILE           JSON options file\n"
             "  --reuse-connection      keep a healthy connection between attempts\n"
             "  --help                  show this text\n";
        return u;
    }

    namespace detail {
        inline unsigned long parseNumber(std::string_view flag, const std::string& v, unsigned long max) {
            if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos)
                throw ArgError(std::string(flag) + ": expected a number, got '" + v + "'");
            unsigned long n = 0;
            try {
                n = std::stoul(v);
            }
            catch (const std::out_of_range&) {
                throw ArgError(std::string(flag) + ": value out of range");
            }
            if (n > max)
                throw ArgError(std::string(flag) + ": value out of range");
            return n;
        }

        inline bool parseState(const std::string& v) {
            if (v == "on" || v == "true" || v == "1")   return true;
            if (v == "off" || v == "false" || v == "0") return false;
            throw ArgError("--state: expected on or off, got '" + v + "'");
        }
    }

    /**
     * @brief Parse argv. Accepts "--flag value" and "--flag=value".
     * @throws ArgError on unknown flags, missing values or missing required flags
     */
    inline ToggleArgs parseArgs(int argc, char** argv) {
        ToggleArgs a;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::optional<std::string> inlineValue;
            if (auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
                inlineValue = arg.substr(eq + 1);
                arg.resize(eq);
            }

            auto value = [&]() -> std::string {
                if (inlineValue) return *inlineValue;
                if (i + 1 >= argc)
                    throw ArgError(arg + ": missing value");
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h")       a.help = true;
            else if (arg == "--device-id")            a.deviceId = value();
            else if (arg == "--device-host")          a.deviceHost = value();
            else if (arg == "--device-port")          a.devicePort = static_cast<uint16_t>(detail::parseNumber(arg, value(), 65535));
            else if (arg == "--state")                a.state = detail::parseState(value());
            else if (arg == "--max-attempts")         a.maxAttempts = static_cast<uint32_t>(detail::parseNumber(arg, value(), 1000));
            else if (arg == "--log-level")            a.logLevel = value();
            else if (arg == "--log-format")           a.logFormat = value();
            else if (arg == "--metrics-port")         a.metricsPort = static_cast<uint16_t>(detail::parseNumber(arg, value(), 65535));
            else if (arg == "--config")               a.configPath = value();
            else if (arg == "--reuse-connection")     a.reuseConnection = true;
            else throw ArgError("unknown argument: " + arg);
        }

        if (a.help) return a;
        if (a.deviceId.empty())   throw ArgError("--device-id is required");
        if (a.deviceHost.empty()) throw ArgError("--device-host is required");
        if (a.devicePort == 0)    throw ArgError("--device-port must be > 0");
        if (a.logFormat != "json" && a.logFormat != "text")
            throw ArgError("--log-format: expected json or text, got '" + a.logFormat + "'");
        return a;
    }

}
