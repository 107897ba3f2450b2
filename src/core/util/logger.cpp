#include "cmdrelay/core/util/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace cmdrelay {

    const char* toString(LogLevel lvl) {
        static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR" };
        return names[static_cast<int>(lvl)];
    }

    LogLevel parseLogLevel(std::string_view name) {
        std::string s(name);
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == "trace") return LogLevel::Trace;
        if (s == "debug") return LogLevel::Debug;
        if (s == "info")  return LogLevel::Info;
        if (s == "warn" || s == "warning") return LogLevel::Warn;
        if (s == "error") return LogLevel::Error;
        throw std::invalid_argument("unknown log level: " + s);
    }

    Logger& Logger::inst() {
        static Logger L;
        return L;
    }

    Logger::Logger() : sink_(makeTextSink()) {}

    void Logger::setSink(Sink s) {
        std::scoped_lock lk(sinkMx_);
        sink_ = s ? std::move(s) : makeTextSink();
    }

    void Logger::log(LogLevel lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::scoped_lock lk(sinkMx_);
        sink_(lvl, msg);
    }

    Logger::Sink Logger::makeTextSink(std::ostream& out) {
        return [&out](LogLevel l, const std::string& m) {
            out << '[' << toString(l) << "] " << m << '\n';
        };
    }

    Logger::Sink Logger::makeJsonSink(std::ostream& out) {
        return [&out](LogLevel l, const std::string& m) {
            using namespace std::chrono;
            nlohmann::json line{
                { "ts",      std::format("{:%FT%TZ}", floor<milliseconds>(system_clock::now())) },
                { "level",   toString(l) },
                { "message", m }
            };
            // replace invalid UTF-8 instead of throwing from inside the logger
            out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        };
    }

}
