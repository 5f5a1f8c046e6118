/*

async_queue.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Bounded FIFO between coroutines on one strand, with close semantics.

*/

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

#include <mailmirror/detail/async_event.hpp>

namespace mailmirror::detail
{

/**
push() suspends while the queue is full and returns false once the queue has
been closed. pop() drains buffered items after close and returns nullopt when
the queue is closed and empty.
**/
template<typename T>
class async_queue
{
public:
    async_queue(mailmirror::asio::any_io_executor executor, std::size_t capacity)
        : readable_(executor), writable_(executor), capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    async_queue(const async_queue&) = delete;
    async_queue& operator=(const async_queue&) = delete;

    mailmirror::asio::awaitable<bool> push(T value)
    {
        while (!closed_ && items_.size() >= capacity_)
            co_await writable_.wait();
        if (closed_)
            co_return false;
        items_.push_back(std::move(value));
        readable_.notify_all();
        co_return true;
    }

    mailmirror::asio::awaitable<std::optional<T>> pop()
    {
        while (items_.empty() && !closed_)
            co_await readable_.wait();
        if (items_.empty())
            co_return std::nullopt;
        std::optional<T> value(std::move(items_.front()));
        items_.pop_front();
        writable_.notify_all();
        co_return value;
    }

    void close() noexcept
    {
        if (closed_)
            return;
        closed_ = true;
        readable_.notify_all();
        writable_.notify_all();
    }

    [[nodiscard]] bool closed() const noexcept
    {
        return closed_;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return items_.size();
    }

private:
    async_condition readable_;
    async_condition writable_;
    std::deque<T> items_;
    std::size_t capacity_;
    bool closed_{false};
};

} // namespace mailmirror::detail
