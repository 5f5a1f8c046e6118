/*

idle_watcher.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Keeps a selected session in IDLE (RFC 2177) and relays mailbox changes.

*/

#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_event.hpp>
#include <mailmirror/detail/deadline.hpp>
#include <mailmirror/detail/latest_slot.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/imap/types.hpp>
#include <mailmirror/sync/account.hpp>

namespace mailmirror::sync
{

using event_relay = mailmirror::detail::latest_slot<mailmirror::imap::event>;

/// IDLE is restarted at least this often; RFC 2177 asks for less than 29 minutes.
inline constexpr std::chrono::minutes DEFAULT_IDLE_FALLBACK{25};

/// NOOP poll period for servers without IDLE.
inline constexpr std::chrono::minutes DEFAULT_POLL_INTERVAL{1};

[[nodiscard]] inline steady_clock::duration effective_fallback(std::chrono::seconds configured, bool idle_supported)
{
    if (configured > std::chrono::seconds::zero())
        return configured;
    if (idle_supported)
        return DEFAULT_IDLE_FALLBACK;
    return DEFAULT_POLL_INTERVAL;
}

/**
Producer side of the account loop. Every fallback round ends with a synthetic
mailbox_status event so that a quiet mailbox is still checked periodically.

`Session` needs supports(), idle() returning an idle session with read_line(),
done(), is_completion(), finish(), abandon() and cancel(), and noop().
**/
template<typename Session>
class idle_watcher
{
public:
    idle_watcher(Session& session, const account& acct, std::chrono::seconds fallback)
        : session_(session),
          account_(acct),
          fallback_(fallback)
    {
    }

    /// Runs until `stop` (success) or until the session fails (connection_failed).
    mailmirror::asio::awaitable<result_void> watch(event_relay& relay, std::stop_token stop)
    {
        const bool idle_supported = session_.supports("IDLE");
        const auto period = effective_fallback(fallback_, idle_supported);

        if (!idle_supported)
        {
            MAILMIRROR_INFO("{}: server lacks IDLE, polling every {}s", account_.prefix(),
                std::chrono::duration_cast<std::chrono::seconds>(period).count());
            co_return co_await poll(relay, period, stop);
        }

        while (!stop.stop_requested())
        {
            auto expired = co_await idle_round(relay, period, stop);
            if (!expired)
                co_return fail<void>(std::move(expired).error());
            if (*expired)
            {
                MAILMIRROR_DEBUG("{}: idle fallback elapsed", account_.prefix());
                relay.put(mailmirror::imap::event{mailmirror::imap::event_kind::mailbox_status, {}});
            }
        }
        co_return ok();
    }

private:
    struct round_state
    {
        explicit round_state(mailmirror::asio::any_io_executor executor)
            : stopper_done(std::move(executor))
        {
        }

        std::stop_source stop;
        mailmirror::detail::async_event stopper_done;
        bool reader_finished = false;
        bool expired = false;
    };

    /// One IDLE command. Yields true when it was ended by the fallback timer.
    mailmirror::asio::awaitable<result<bool>> idle_round(event_relay& relay,
        steady_clock::duration period, std::stop_token stop)
    {
        auto started = co_await session_.idle();
        if (!started)
            co_return fail<bool>(nest_error(errc::connection_failed, "IDLE failed", std::move(started).error()));
        auto idle = std::move(*started);

        auto executor = co_await mailmirror::asio::this_coro::executor;
        round_state round(executor);
        std::stop_callback forward_stop(stop, [&round]
        {
            round.stop.request_stop();
        });

        mailmirror::asio::co_spawn(executor, [&]() -> mailmirror::asio::awaitable<void>
        {
            const bool elapsed = co_await mailmirror::detail::sleep_for(period, round.stop.get_token());
            if (!round.reader_finished)
            {
                round.expired = elapsed;
                auto sent = co_await idle.done();
                if (!sent)
                {
                    MAILMIRROR_WARN("{}: cannot end IDLE: {}", account_.prefix(), format_error(sent.error()));
                    idle.cancel();
                }
            }
            round.stopper_done.set();
        }, mailmirror::asio::detached);

        std::optional<error_info> failure;
        while (true)
        {
            auto line = co_await idle.read_line();
            if (!line)
            {
                failure = nest_error(errc::connection_failed, "IDLE session failed", std::move(line).error());
                break;
            }
            if (idle.is_completion(*line))
            {
                auto finished = idle.finish(*line);
                if (!finished)
                    failure = nest_error(errc::connection_failed, "IDLE ended with an error", std::move(finished).error());
                break;
            }
            if (mailmirror::imap::is_bye_line(*line))
            {
                failure = make_error(errc::connection_failed, "server closed the IDLE session", *line);
                break;
            }

            const auto kind = mailmirror::imap::classify_untagged(*line);
            if (kind == mailmirror::imap::event_kind::mailbox_status)
            {
                MAILMIRROR_DEBUG("{}: new update: {}", account_.prefix(), *line);
                if (relay.put(mailmirror::imap::event{kind, *line}))
                    MAILMIRROR_DEBUG("{}: pending update replaced", account_.prefix());
            }
            else
            {
                MAILMIRROR_DEBUG("{}: ignoring {} update: {}", account_.prefix(),
                    mailmirror::imap::to_string(kind), *line);
            }
        }

        round.reader_finished = true;
        round.stop.request_stop();
        co_await round.stopper_done.wait();

        if (failure)
        {
            idle.abandon();
            co_return fail<bool>(std::move(*failure));
        }
        co_return ok(round.expired);
    }

    mailmirror::asio::awaitable<result_void> poll(event_relay& relay, steady_clock::duration period,
        std::stop_token stop)
    {
        while (co_await mailmirror::detail::sleep_for(period, stop))
        {
            auto res = co_await session_.noop();
            if (!res)
                co_return fail<void>(nest_error(errc::connection_failed, "NOOP failed", std::move(res).error()));
            for (const auto& line : res->untagged_lines)
            {
                if (mailmirror::imap::is_bye_line(line))
                    co_return fail<void>(errc::connection_failed, "server closed the session", line);
                MAILMIRROR_DEBUG("{}: {} update: {}", account_.prefix(),
                    mailmirror::imap::to_string(mailmirror::imap::classify_untagged(line)), line);
            }
            relay.put(mailmirror::imap::event{mailmirror::imap::event_kind::mailbox_status, {}});
        }
        co_return ok();
    }

    Session& session_;
    const account& account_;
    std::chrono::seconds fallback_;
};

} // namespace mailmirror::sync
