/*

account_engine.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Per-account control loop: connect, watch the source, mirror on every change.

*/

#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_event.hpp>
#include <mailmirror/detail/exception_bridge.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/imap/types.hpp>
#include <mailmirror/sync/account.hpp>
#include <mailmirror/sync/connection_manager.hpp>
#include <mailmirror/sync/idle_watcher.hpp>
#include <mailmirror/sync/sync_pipeline.hpp>

namespace mailmirror::sync
{

/**
Drives one account through its lifecycle. No cycle is retried: the first error
of init(), watch() or handle() is the outcome of the account.

`Connector` provides `session_type`, open(store_role, open_mode, stop_token)
yielding a std::unique_ptr<session_type>, and close(session_type&).
**/
template<typename Connector>
class account_engine
{
public:
    using session_type = typename Connector::session_type;
    using session_ptr = std::unique_ptr<session_type>;

    account_engine(account& acct, Connector& connector)
        : account_(acct),
          connector_(connector)
    {
    }

    account_engine(const account_engine&) = delete;
    account_engine& operator=(const account_engine&) = delete;

    /// Probe both stores, then open the IDLE session and queue an initial check.
    mailmirror::asio::awaitable<result_void> init(std::stop_token stop)
    {
        auto executor = co_await mailmirror::asio::this_coro::executor;
        if (!account_.transition(lifecycle::connecting))
            co_return report(make_error(errc::connection_failed, "account cannot connect in its current state"));

        MAILMIRROR_INFO("{}: connecting", account_.prefix());
        for (const store_role role : {store_role::source, store_role::target})
        {
            auto probed = co_await probe(role, stop);
            if (!probed)
                co_return report(std::move(probed).error());
        }

        auto opened = co_await connector_.open(store_role::source, open_mode::idle, stop);
        if (!opened)
            co_return report(std::move(opened).error());
        idle_session_ = std::move(*opened);

        relay_ = std::make_unique<event_relay>(executor);
        relay_->put(mailmirror::imap::event{mailmirror::imap::event_kind::mailbox_status, {}});

        account_.transition(lifecycle::connected);
        MAILMIRROR_INFO("{}: connected", account_.prefix());
        co_return ok();
    }

    /// Idle on the source and run handle() for every mailbox change until stopped or failed.
    mailmirror::asio::awaitable<result_void> watch(std::stop_token stop)
    {
        if (!idle_session_ || !relay_)
            co_return report(make_error(errc::connection_failed, "account is not connected"));

        state_guard guard(account_, lifecycle::watching);
        if (!guard.entered())
            co_return report(make_error(errc::connection_failed, "account cannot watch in its current state"));

        auto executor = co_await mailmirror::asio::this_coro::executor;
        MAILMIRROR_INFO("{}: begin idling", account_.prefix());

        std::stop_source watch_stop;
        std::stop_callback forward_stop(stop, [&watch_stop]
        {
            watch_stop.request_stop();
        });

        idle_watcher<session_type> watcher(*idle_session_, account_, account_.source().idle_fallback);
        mailmirror::detail::async_event watcher_done(executor);
        result_void watched = ok();

        mailmirror::asio::co_spawn(executor, [&]() -> mailmirror::asio::awaitable<void>
        {
            watched = co_await protect_awaitable([&]
            {
                return watcher.watch(*relay_, watch_stop.get_token());
            }, errc::connection_failed);
            relay_->close();
            watcher_done.set();
        }, mailmirror::asio::detached);

        result_void handled = ok();
        while (auto update = co_await relay_->take())
        {
            if (stop.stop_requested())
                break;
            if (update->kind != mailmirror::imap::event_kind::mailbox_status)
            {
                MAILMIRROR_DEBUG("{}: skipping {} update", account_.prefix(), mailmirror::imap::to_string(update->kind));
                continue;
            }

            MAILMIRROR_INFO("{}: new update", account_.prefix());
            handled = co_await handle(stop);
            if (!handled)
                break;
        }

        watch_stop.request_stop();
        co_await watcher_done.wait();

        if (!handled)
            co_return handled;
        if (!watched)
        {
            MAILMIRROR_INFO("{}: not idling anymore", account_.prefix());
            co_return report(std::move(watched).error());
        }
        MAILMIRROR_INFO("{}: stopped idling", account_.prefix());
        co_return ok();
    }

    /// One mirror cycle on fresh sessions; both are logged out whatever the outcome.
    mailmirror::asio::awaitable<result_void> handle(std::stop_token stop)
    {
        state_guard guard(account_, lifecycle::handling);
        if (!guard.entered())
            co_return report(make_error(errc::connection_failed, "account cannot handle messages in its current state"));

        MAILMIRROR_INFO("{}: begin handling", account_.prefix());

        auto source = co_await connector_.open(store_role::source, open_mode::plain, stop);
        if (!source)
            co_return report(std::move(source).error());

        auto target = co_await connector_.open(store_role::target, open_mode::plain, stop);
        if (!target)
        {
            co_await release(**source);
            co_return report(std::move(target).error());
        }

        sync_pipeline<session_type> pipeline(account_);
        auto res = co_await pipeline.run(**source, **target);

        co_await release(**target);
        co_await release(**source);

        if (!res)
        {
            MAILMIRROR_INFO("{}: message handling failed", account_.prefix());
            co_return report(std::move(res).error());
        }
        MAILMIRROR_INFO("{}: message handling successful", account_.prefix());
        co_return ok();
    }

    /// Release the IDLE session; the account ends up in `initial`.
    mailmirror::asio::awaitable<result_void> close()
    {
        account_.transition(lifecycle::shutdown);

        result_void res = ok();
        if (idle_session_)
        {
            res = co_await connector_.close(*idle_session_);
            idle_session_.reset();
        }
        relay_.reset();

        if (!res)
            MAILMIRROR_WARN("{}: {}", account_.prefix(), format_error(res.error()));
        account_.transition(lifecycle::initial);
        co_return res;
    }

    /// init() then watch(); the outcome is kept as the account's last error.
    mailmirror::asio::awaitable<result_void> run(std::stop_token stop)
    {
        auto res = co_await init(stop);
        if (res)
            res = co_await watch(stop);
        remember(res);
        co_return res;
    }

    /// init() then a single handle().
    mailmirror::asio::awaitable<result_void> once(std::stop_token stop)
    {
        auto res = co_await init(stop);
        if (res)
            res = co_await handle(stop);
        remember(res);
        co_return res;
    }

    [[nodiscard]] const account& get_account() const noexcept
    {
        return account_;
    }

private:
    mailmirror::asio::awaitable<result_void> probe(store_role role, std::stop_token stop)
    {
        auto opened = co_await connector_.open(role, open_mode::plain, stop);
        if (!opened)
            co_return fail<void>(std::move(opened).error());
        co_return co_await connector_.close(**opened);
    }

    mailmirror::asio::awaitable<void> release(session_type& session)
    {
        auto res = co_await connector_.close(session);
        if (!res)
            MAILMIRROR_WARN("{}: {}", account_.prefix(), format_error(res.error()));
    }

    /// Log an error against the current state and hand it back.
    result_void report(error_info err)
    {
        MAILMIRROR_ERROR("{}: {}", account_.prefix(), format_error(err));
        return fail<void>(std::move(err));
    }

    void remember(const result_void& res)
    {
        if (res)
            account_.set_last_error(std::nullopt);
        else
            account_.set_last_error(res.error());
    }

    account& account_;
    Connector& connector_;
    session_ptr idle_session_;
    std::unique_ptr<event_relay> relay_;
};

} // namespace mailmirror::sync
