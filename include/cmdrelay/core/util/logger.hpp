/**
 * @file logger.hpp
 * @brief Process-wide logger and the LOG_* macros used by the library.
 *
 * The library never writes to a stream directly. Everything goes through
 * Logger::inst(), whose sink the embedding process chooses (plain text by
 * default, JSON lines for the toggle harness).
 *
 * @date 2025
 */
#pragma once
#include <atomic>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace cmdrelay {

    enum class LogLevel { Trace, Debug, Info, Warn, Error };

    /**
     * @class Logger
     * @brief Thread-safe singleton with a level filter and a replaceable sink.
     *
     * The sink is invoked under a mutex, so lines from different device lanes
     * never interleave.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        static Logger& inst();

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }
        bool enabled(LogLevel lvl) const { return lvl >= level(); }

        void setSink(Sink s);
        void log(LogLevel lvl, const std::string& msg);

        /**
         * @brief `[LEVEL] message` lines on @p out.
         */
        static Sink makeTextSink(std::ostream& out = std::cout);

        /**
         * @brief One JSON object per line: {"ts","level","message"}.
         */
        static Sink makeJsonSink(std::ostream& out = std::cout);

    private:
        Logger();

        std::mutex sinkMx_;
        std::atomic<LogLevel> level_{ LogLevel::Info };
        Sink sink_;
    };

    /**
     * @brief Upper-case name of a level ("TRACE", "DEBUG", ...).
     */
    const char* toString(LogLevel lvl);

    /**
     * @brief Parse a level name, case-insensitive. "warning" is accepted for Warn.
     * @throws std::invalid_argument for unknown names
     */
    LogLevel parseLogLevel(std::string_view name);

}

// The message expression is only evaluated when the level is enabled.
#define CMDRELAY_LOG(lvl, msg)                                      \
    do {                                                            \
        auto& cmdrelay_logger_ = ::cmdrelay::Logger::inst();        \
        if (cmdrelay_logger_.enabled(lvl))                          \
            cmdrelay_logger_.log(lvl, msg);                         \
    } while (0)

#define LOG_TRACE(msg) CMDRELAY_LOG(::cmdrelay::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) CMDRELAY_LOG(::cmdrelay::LogLevel::Debug, msg)
#define LOG_INFO(msg)  CMDRELAY_LOG(::cmdrelay::LogLevel::Info,  msg)
#define LOG_WARN(msg)  CMDRELAY_LOG(::cmdrelay::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) CMDRELAY_LOG(::cmdrelay::LogLevel::Error, msg)
