/*

deadline.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <functional>
#include <memory>
#include <stop_token>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_event.hpp>
#include <mailmirror/detail/result.hpp>

namespace mailmirror::detail
{

enum class deadline_outcome
{
    completed,
    expired,
    stopped
};

/**
Await `op` but call `cancel` when `timeout` elapses or `stop` is requested.
`cancel` must make `op` complete promptly (typically by cancelling the
socket); the outcome tells which of the three happened first.
**/
template<typename T>
mailmirror::asio::awaitable<std::pair<result<T>, deadline_outcome>> with_deadline(
    mailmirror::asio::awaitable<result<T>> op,
    steady_clock::duration timeout,
    std::stop_token stop,
    std::function<void()> cancel)
{
    struct state_t
    {
        explicit state_t(mailmirror::asio::any_io_executor ex)
            : timer(ex), watchdog_done(ex)
        {
        }

        mailmirror::asio::steady_timer timer;
        async_event watchdog_done;
        std::function<void()> cancel;
        deadline_outcome outcome = deadline_outcome::completed;
        bool finished = false;
    };

    auto executor = co_await mailmirror::asio::this_coro::executor;
    auto state = std::make_shared<state_t>(executor);
    state->cancel = std::move(cancel);
    state->timer.expires_after(timeout);

    mailmirror::asio::co_spawn(executor, [state]() -> mailmirror::asio::awaitable<void>
    {
        mailmirror::asio::error_code ec;
        co_await state->timer.async_wait(mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
        if (!ec && !state->finished && state->outcome == deadline_outcome::completed)
        {
            state->outcome = deadline_outcome::expired;
            state->cancel();
        }
        state->watchdog_done.set();
    }, mailmirror::asio::detached);

    std::stop_callback on_stop(stop, [state, executor]
    {
        mailmirror::asio::post(executor, [state]
        {
            if (state->finished || state->outcome != deadline_outcome::completed)
                return;
            state->outcome = deadline_outcome::stopped;
            state->cancel();
        });
    });

    result<T> res = co_await std::move(op);
    state->finished = true;
    state->timer.cancel();
    co_await state->watchdog_done.wait();
    co_return std::make_pair(std::move(res), state->outcome);
}

/// Sleep for `duration`; false when `stop` was requested before it elapsed.
inline mailmirror::asio::awaitable<bool> sleep_for(steady_clock::duration duration, std::stop_token stop)
{
    auto executor = co_await mailmirror::asio::this_coro::executor;
    auto timer = std::make_shared<mailmirror::asio::steady_timer>(executor);
    timer->expires_after(duration);

    std::stop_callback on_stop(stop, [timer, executor]
    {
        mailmirror::asio::post(executor, [timer]
        {
            timer->cancel();
        });
    });
    if (stop.stop_requested())
        co_return false;

    mailmirror::asio::error_code ec;
    co_await timer->async_wait(mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
    co_return !stop.stop_requested();
}

} // namespace mailmirror::detail
