/*

async_mutex.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_event.hpp>

namespace mailmirror::detail
{

/**
Ticket lock for coroutines sharing one executor. Waiters are served in the
order they called lock().
**/
class async_mutex
{
public:
    /// Releases the ticket it holds on destruction.
    class scoped_lock
    {
    public:
        scoped_lock() noexcept = default;

        scoped_lock(scoped_lock&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr))
        {
        }

        scoped_lock& operator=(scoped_lock&& other) noexcept
        {
            if (this != &other)
            {
                release();
                owner_ = std::exchange(other.owner_, nullptr);
            }
            return *this;
        }

        scoped_lock(const scoped_lock&) = delete;
        scoped_lock& operator=(const scoped_lock&) = delete;

        ~scoped_lock()
        {
            release();
        }

    private:
        friend class async_mutex;

        explicit scoped_lock(async_mutex* owner) noexcept
            : owner_(owner)
        {
        }

        void release() noexcept
        {
            if (owner_ == nullptr)
                return;
            ++owner_->serving_;
            owner_->turn_.notify_all();
            owner_ = nullptr;
        }

        async_mutex* owner_{nullptr};
    };

    explicit async_mutex(mailmirror::asio::any_io_executor executor)
        : turn_(std::move(executor))
    {
    }

    async_mutex(const async_mutex&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;

    mailmirror::asio::awaitable<scoped_lock> lock()
    {
        const std::uint64_t ticket = next_ticket_++;
        while (serving_ != ticket)
            co_await turn_.wait();
        co_return scoped_lock(this);
    }

private:
    async_condition turn_;
    std::uint64_t next_ticket_{0};
    std::uint64_t serving_{0};
};

} // namespace mailmirror::detail
