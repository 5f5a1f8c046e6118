/*

account.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Account pair definition and its lifecycle state machine.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>

namespace mailmirror::sync
{

enum class auth_mode
{
    password,
    oauth2
};

[[nodiscard]] constexpr std::string_view to_string(auth_mode mode) noexcept
{
    return mode == auth_mode::oauth2 ? "oauth2" : "password";
}

/// Where and how to log in; shared by both ends of an account.
struct mail_store_credentials
{
    std::string server;
    std::string username;
    std::string password;
    std::string mailbox{"INBOX"};
    auth_mode auth = auth_mode::password;
    std::string provider;
};

struct source_store
{
    mail_store_credentials store;
    /// Zero selects the default for the server (IDLE or NOOP polling).
    std::chrono::seconds idle_fallback{0};
};

struct target_store
{
    mail_store_credentials store;
};

enum class store_role
{
    source,
    target
};

[[nodiscard]] constexpr std::string_view to_string(store_role role) noexcept
{
    return role == store_role::source ? "source" : "target";
}

enum class lifecycle : std::uint8_t
{
    initial = 0,
    connecting = 1,
    connected = 2,
    watching = 3,
    handling = 4,
    shutdown = 5
};

[[nodiscard]] constexpr std::string_view to_string(lifecycle state) noexcept
{
    switch (state)
    {
        case lifecycle::initial: return "initial";
        case lifecycle::connecting: return "connecting";
        case lifecycle::connected: return "connected";
        case lifecycle::watching: return "watching";
        case lifecycle::handling: return "handling";
        case lifecycle::shutdown: return "shutdown";
    }
    return "unknown";
}

/**
Allowed lifecycle moves. Every state may enter shutdown; shutdown only leads
back to initial. The reverse edges out of watching and handling exist so a
phase can restore the state it started from.
**/
[[nodiscard]] constexpr bool is_valid_transition(lifecycle from, lifecycle to) noexcept
{
    if (to == lifecycle::shutdown)
        return true;
    switch (from)
    {
        case lifecycle::initial:
            return to == lifecycle::connecting;
        case lifecycle::connecting:
            return to == lifecycle::connected;
        case lifecycle::connected:
            return to == lifecycle::watching || to == lifecycle::handling;
        case lifecycle::watching:
            return to == lifecycle::handling || to == lifecycle::connected;
        case lifecycle::handling:
            return to == lifecycle::watching || to == lifecycle::connected;
        case lifecycle::shutdown:
            return to == lifecycle::initial;
    }
    return false;
}

/// One source/target pair. Only its engine mutates it; the counters may be read from anywhere.
class account
{
public:
    account(std::string name, source_store source, target_store target)
        : name_(std::move(name)),
          source_(std::move(source)),
          target_(std::move(target))
    {
    }

    account(const account&) = delete;
    account& operator=(const account&) = delete;

    [[nodiscard]] const std::string& name() const noexcept
    {
        return name_;
    }

    [[nodiscard]] const source_store& source() const noexcept
    {
        return source_;
    }

    [[nodiscard]] const target_store& target() const noexcept
    {
        return target_;
    }

    [[nodiscard]] const mail_store_credentials& store(store_role role) const noexcept
    {
        return role == store_role::source ? source_.store : target_.store;
    }

    [[nodiscard]] lifecycle state() const noexcept
    {
        return static_cast<lifecycle>(state_.load(std::memory_order_acquire));
    }

    /// Move to `to` if the table allows it; a rejected move is logged and leaves the state alone.
    bool transition(lifecycle to)
    {
        const lifecycle from = state();
        if (from == to)
            return true;
        if (!is_valid_transition(from, to))
        {
            MAILMIRROR_WARN("{}: rejected state transition {} -> {}", prefix(), to_string(from), to_string(to));
            return false;
        }
        state_.store(static_cast<std::uint8_t>(to), std::memory_order_release);
        MAILMIRROR_DEBUG("{} [{}]: state changed from {}", name_, to_string(to), to_string(from));
        return true;
    }

    /// Silent transition for destructors; false when the table rejects it.
    bool restore(lifecycle to) noexcept
    {
        const lifecycle from = state();
        if (from != to && !is_valid_transition(from, to))
            return false;
        state_.store(static_cast<std::uint8_t>(to), std::memory_order_release);
        return true;
    }

    [[nodiscard]] std::uint64_t processed() const noexcept
    {
        return processed_.load(std::memory_order_relaxed);
    }

    void add_processed(std::uint64_t n = 1) noexcept
    {
        processed_.fetch_add(n, std::memory_order_relaxed);
    }

    [[nodiscard]] std::optional<error_info> last_error() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

    void set_last_error(std::optional<error_info> err)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = std::move(err);
    }

    /// `<name> [<state>]`, the prefix of every engine log line.
    [[nodiscard]] std::string prefix() const
    {
        return fmt::format("{} [{}]", name_, to_string(state()));
    }

private:
    std::string name_;
    source_store source_;
    target_store target_;
    std::atomic<std::uint8_t> state_{static_cast<std::uint8_t>(lifecycle::initial)};
    std::atomic<std::uint64_t> processed_{0};
    mutable std::mutex mutex_;
    std::optional<error_info> last_error_;
};

/**
Enter a phase for the lifetime of the guard and put the previous state back on
every exit path, unless the account was shut down in the meantime.
**/
class state_guard
{
public:
    state_guard(account& acct, lifecycle phase)
        : account_(acct),
          previous_(acct.state()),
          entered_(acct.transition(phase))
    {
    }

    state_guard(const state_guard&) = delete;
    state_guard& operator=(const state_guard&) = delete;

    ~state_guard()
    {
        if (!entered_ || account_.state() == lifecycle::shutdown)
            return;
        account_.restore(previous_);
    }

    [[nodiscard]] bool entered() const noexcept
    {
        return entered_;
    }

    [[nodiscard]] lifecycle previous() const noexcept
    {
        return previous_;
    }

private:
    account& account_;
    lifecycle previous_;
    bool entered_;
};

} // namespace mailmirror::sync
