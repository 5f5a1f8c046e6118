/*

async_event.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Coroutine synchronisation primitives built on a never-expiring steady_timer.
They assume all users run on one strand (the account's io_context thread).

*/

#pragma once

#include <cstddef>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>

namespace mailmirror::detail
{

/**
Condition variable for coroutines. wait() suspends until the next notify_all();
callers re-check their predicate in a loop.
**/
class async_condition
{
public:
    explicit async_condition(mailmirror::asio::any_io_executor executor)
        : timer_(std::move(executor))
    {
        timer_.expires_at(mailmirror::asio::steady_timer::time_point::max());
    }

    async_condition(const async_condition&) = delete;
    async_condition& operator=(const async_condition&) = delete;

    mailmirror::asio::awaitable<void> wait()
    {
        mailmirror::asio::error_code ec;
        co_await timer_.async_wait(mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
    }

    void notify_all() noexcept
    {
        mailmirror::asio::error_code ignored;
        timer_.cancel(ignored);
    }

private:
    mailmirror::asio::steady_timer timer_;
};

/// Manual-reset event.
class async_event
{
public:
    explicit async_event(mailmirror::asio::any_io_executor executor)
        : cond_(std::move(executor))
    {
    }

    void set() noexcept
    {
        if (set_)
            return;
        set_ = true;
        cond_.notify_all();
    }

    [[nodiscard]] bool is_set() const noexcept
    {
        return set_;
    }

    mailmirror::asio::awaitable<void> wait()
    {
        while (!set_)
            co_await cond_.wait();
    }

private:
    async_condition cond_;
    bool set_{false};
};

/// Counts outstanding coroutines; wait() resumes once all of them called done().
class wait_group
{
public:
    explicit wait_group(mailmirror::asio::any_io_executor executor)
        : cond_(std::move(executor))
    {
    }

    void add(std::size_t n = 1) noexcept
    {
        pending_ += n;
    }

    void done() noexcept
    {
        if (pending_ > 0 && --pending_ == 0)
            cond_.notify_all();
    }

    [[nodiscard]] std::size_t pending() const noexcept
    {
        return pending_;
    }

    mailmirror::asio::awaitable<void> wait()
    {
        while (pending_ > 0)
            co_await cond_.wait();
    }

private:
    async_condition cond_;
    std::size_t pending_{0};
};

} // namespace mailmirror::detail
