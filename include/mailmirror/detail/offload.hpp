/*

offload.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <type_traits>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/exception_bridge.hpp>

namespace mailmirror::detail
{

/**
Run a blocking callable returning result<T> on `pool` and resume the calling
coroutine on its own executor with the outcome. Exceptions thrown by `fn` are
reported as `fallback`.
**/
template<typename F>
auto offload(mailmirror::asio::thread_pool& pool, F fn, errc fallback)
    -> mailmirror::asio::awaitable<std::invoke_result_t<F&>>
{
    using result_t = std::invoke_result_t<F&>;
    static_assert(is_result_v<result_t>, "offload expects a callable returning result<T>");

    co_return co_await mailmirror::asio::co_spawn(pool.get_executor(),
        [fn = std::move(fn), fallback]() mutable -> mailmirror::asio::awaitable<result_t>
        {
            try
            {
                co_return fn();
            }
            catch (...)
            {
                co_return make_unexpected(from_exception(std::current_exception(), fallback));
            }
        },
        mailmirror::asio::use_awaitable);
}

} // namespace mailmirror::detail
