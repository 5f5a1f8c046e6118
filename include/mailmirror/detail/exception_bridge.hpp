/*

exception_bridge.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Turns exceptions escaping jsoncpp, allocation or Asio into error_info values.

*/

#pragma once

#include <exception>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <json/json.h>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/result.hpp>

namespace mailmirror
{

namespace detail
{

template<class>
struct awaitable_value;

template<class T, class Executor>
struct awaitable_value<mailmirror::asio::awaitable<T, Executor>>
{
    using type = T;
};

template<class T>
using awaitable_value_t = typename awaitable_value<std::remove_cvref_t<T>>::type;

template<class>
inline constexpr bool is_result_impl = false;

template<class T>
inline constexpr bool is_result_impl<result<T>> = true;

template<class T>
inline constexpr bool is_result_v = is_result_impl<std::remove_cvref_t<T>>;

} // namespace detail

/// Classify the pending exception `eptr` as an error of kind `kind`.
[[nodiscard]] inline error_info from_exception(std::exception_ptr eptr, errc kind,
    std::source_location where = std::source_location::current())
{
    std::string message = "unknown exception";
    std::string detail;
    std::error_code sys;
    try
    {
        if (eptr)
            std::rethrow_exception(eptr);
    }
    catch (const Json::Exception& exc)
    {
        message = exc.what();
        detail = "source=json\n";
    }
    catch (const mailmirror::asio::system_error& exc)
    {
        message = exc.what();
        sys = std::error_code(exc.code().value(), std::system_category());
    }
    catch (const std::system_error& exc)
    {
        message = exc.what();
        sys = exc.code();
    }
    catch (const std::exception& exc)
    {
        message = exc.what();
    }
    catch (...)
    {
        detail = "source=foreign\n";
    }
    return make_error(kind, std::move(message), std::move(detail), sys, where);
}

/**
Await `f()`, an awaitable<result<T>>, and report an escaping exception as an
error of kind `kind` instead of letting it unwind the caller.
**/
template<class F>
[[nodiscard]] auto protect_awaitable(F&& f, errc kind)
    -> mailmirror::asio::awaitable<detail::awaitable_value_t<std::invoke_result_t<F>>>
{
    using value_t = detail::awaitable_value_t<std::invoke_result_t<F>>;
    static_assert(detail::is_result_v<value_t>, "protect_awaitable expects an awaitable<result<T>>");
    std::exception_ptr eptr;
    try
    {
        co_return co_await std::invoke(std::forward<F>(f));
    }
    catch (...)
    {
        eptr = std::current_exception();
    }
    co_return detail::make_unexpected(from_exception(eptr, kind));
}

} // namespace mailmirror
