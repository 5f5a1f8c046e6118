/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process wide logger of the daemon: a level filter, an optional sink replacing
the stderr writer, and IMAP/MQTT wire tracing behind its own switch.

*/

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace mailmirror::log
{

enum class level : std::uint8_t
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/// Wire direction of a traced protocol line.
enum class direction : std::uint8_t
{
    send,
    receive
};

/// One emitted record. `protocol` is set for wire traces only.
struct record
{
    level lvl{level::info};
    std::chrono::system_clock::time_point when;
    std::string text;
    std::source_location where;
    std::optional<std::string> protocol;
    direction dir{direction::send};
};

using sink_t = std::function<void(const record&)>;

inline constexpr std::array<std::string_view, 7> LEVEL_NAMES{"trace", "debug", "info", "warn", "error", "fatal", "off"};

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    const auto index = static_cast<std::size_t>(lvl);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : std::string_view("?");
}

/// Level named in the configuration or on the command line; `warning` is accepted for `warn`.
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    if (name == "warning")
        return level::warn;
    for (std::size_t i = 0; i < LEVEL_NAMES.size(); ++i)
    {
        if (LEVEL_NAMES[i] == name)
            return static_cast<level>(i);
    }
    return std::nullopt;
}

class logger
{
public:
    static logger& instance() noexcept
    {
        static logger shared;
        return shared;
    }

    void set_level(level lvl) noexcept
    {
        threshold_.store(lvl, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && lvl >= threshold_.load(std::memory_order_relaxed);
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_.load(std::memory_order_relaxed);
    }

    /// Route records to `sink`; an empty function restores stderr output.
    void set_sink(sink_t sink)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        sink_ = std::move(sink);
    }

    void log(level lvl, std::string text, std::source_location where = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;
        record rec;
        rec.lvl = lvl;
        rec.when = std::chrono::system_clock::now();
        rec.text = std::move(text);
        rec.where = where;
        emit(rec);
    }

    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
        std::source_location where = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;
        record rec;
        rec.lvl = level::trace;
        rec.when = std::chrono::system_clock::now();
        rec.text = printable(data);
        rec.where = where;
        rec.protocol = std::string(protocol);
        rec.dir = dir;
        emit(rec);
    }

private:
    logger() = default;

    static constexpr std::size_t MAX_TRACE_LENGTH = 500;

    void emit(const record& rec)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (sink_)
        {
            sink_(rec);
            return;
        }
        write_stderr(rec);
    }

    static void write_stderr(const record& rec)
    {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(rec.when);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(rec.when.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        std::string line = fmt::format("[{:02}:{:02}:{:02}.{:03}] ", local.tm_hour, local.tm_min, local.tm_sec, millis);
        if (rec.protocol)
            line += fmt::format("{} {} {}\n", *rec.protocol, rec.dir == direction::send ? ">>>" : "<<<", rec.text);
        else
            line += fmt::format("{:<5} {}\n", level_to_string(rec.lvl), rec.text);
        std::fputs(line.c_str(), stderr);
    }

    /// Control characters shown as '.', trailing CRLF dropped, long payloads cut.
    [[nodiscard]] static std::string printable(std::string_view data)
    {
        while (!data.empty() && (data.back() == '\r' || data.back() == '\n'))
            data.remove_suffix(1);
        const bool cut = data.size() > MAX_TRACE_LENGTH;
        std::string out(data.substr(0, MAX_TRACE_LENGTH));
        for (char& ch : out)
        {
            if (static_cast<unsigned char>(ch) < 0x20)
                ch = '.';
        }
        if (cut)
            out += " [truncated]";
        return out;
    }

    std::atomic<level> threshold_{level::info};
    std::atomic<bool> trace_{false};
    std::mutex mutex_;
    sink_t sink_;
};

} // namespace mailmirror::log

// Arguments are a {fmt} format string and its values.
#define MAILMIRROR_LOG(lvl, ...) \
    do \
    { \
        auto& mailmirror_logger_ = ::mailmirror::log::logger::instance(); \
        if (mailmirror_logger_.is_enabled(lvl)) \
            mailmirror_logger_.log(lvl, ::fmt::format(__VA_ARGS__), std::source_location::current()); \
    } while (0)

#define MAILMIRROR_TRACE(...)  MAILMIRROR_LOG(::mailmirror::log::level::trace, __VA_ARGS__)
#define MAILMIRROR_DEBUG(...)  MAILMIRROR_LOG(::mailmirror::log::level::debug, __VA_ARGS__)
#define MAILMIRROR_INFO(...)   MAILMIRROR_LOG(::mailmirror::log::level::info, __VA_ARGS__)
#define MAILMIRROR_WARN(...)   MAILMIRROR_LOG(::mailmirror::log::level::warn, __VA_ARGS__)
#define MAILMIRROR_ERROR(...)  MAILMIRROR_LOG(::mailmirror::log::level::error, __VA_ARGS__)
#define MAILMIRROR_FATAL(...)  MAILMIRROR_LOG(::mailmirror::log::level::fatal, __VA_ARGS__)

#define MAILMIRROR_TRACE_SEND(protocol, data) \
    ::mailmirror::log::logger::instance().trace_protocol(protocol, ::mailmirror::log::direction::send, data)

#define MAILMIRROR_TRACE_RECV(protocol, data) \
    ::mailmirror::log::logger::instance().trace_protocol(protocol, ::mailmirror::log::direction::receive, data)
