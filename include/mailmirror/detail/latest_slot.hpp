/*

latest_slot.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include <mailmirror/detail/async_event.hpp>

namespace mailmirror::detail
{

/**
Single-slot relay where the newest value wins. put() never blocks: a value that
has not been taken yet is replaced. take() suspends until a value is available
or the slot is closed; a pending value is still delivered after close.
**/
template<typename T>
class latest_slot
{
public:
    explicit latest_slot(mailmirror::asio::any_io_executor executor)
        : cond_(std::move(executor))
    {
    }

    latest_slot(const latest_slot&) = delete;
    latest_slot& operator=(const latest_slot&) = delete;

    /// Returns true when a pending value was overwritten.
    bool put(T value)
    {
        if (closed_)
            return false;
        const bool replaced = value_.has_value();
        if (replaced)
            ++coalesced_;
        value_ = std::move(value);
        cond_.notify_all();
        return replaced;
    }

    mailmirror::asio::awaitable<std::optional<T>> take()
    {
        while (!value_ && !closed_)
            co_await cond_.wait();
        std::optional<T> out = std::exchange(value_, std::nullopt);
        co_return out;
    }

    void close() noexcept
    {
        closed_ = true;
        cond_.notify_all();
    }

    [[nodiscard]] bool closed() const noexcept
    {
        return closed_;
    }

    [[nodiscard]] bool has_value() const noexcept
    {
        return value_.has_value();
    }

    [[nodiscard]] std::size_t coalesced() const noexcept
    {
        return coalesced_;
    }

private:
    async_condition cond_;
    std::optional<T> value_;
    std::size_t coalesced_{0};
    bool closed_{false};
};

} // namespace mailmirror::detail
