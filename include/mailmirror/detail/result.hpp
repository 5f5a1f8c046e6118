/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Library paths do not throw: every failure is returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <mailmirror/detail/error_detail.hpp>

namespace mailmirror
{

/// Error codes for mailmirror operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Engine error kinds (100-199)
    config_invalid = 100,
    connection_failed = 101,
    fetch_failed = 102,
    store_failed = 103,
    cleanup_failed = 104,
    auth_failed = 105,
    broker_failed = 106,

    // Network (200-299)
    net_resolve_failed = 200,
    net_connect_failed = 201,
    net_timeout = 202,
    net_eof = 203,
    net_cancelled = 204,
    net_connection_refused = 205,
    net_connection_reset = 206,
    net_io_failed = 207,
    tls_handshake_failed = 208,
    tls_verify_failed = 209,

    // IMAP (300-399)
    imap_tagged_no = 300,
    imap_tagged_bad = 301,
    imap_continuation_expected = 302,
    imap_parse_error = 303,
    imap_invalid_state = 304,
    imap_bye = 305,

    // MQTT (400-499)
    mqtt_connack_refused = 400,
    mqtt_subscribe_refused = 401,
    mqtt_protocol_error = 402,
    mqtt_invalid_state = 403,

    // OAuth2 / SASL (500-599)
    oauth2_http_failed = 500,
    oauth2_access_denied = 501,
    oauth2_expired_token = 502,
    oauth2_invalid_response = 503,
    oauth2_unknown_provider = 504,
    oauth2_refresh_unavailable = 505,
    sasl_xoauth2_error = 506,

    // Input validation and internal (900-999)
    codec_invalid_input = 900,
    invalid_argument = 901,
    internal_error = 902,
    cancelled = 903,
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::config_invalid: return "config_invalid";
        case errc::connection_failed: return "connection_failed";
        case errc::fetch_failed: return "fetch_failed";
        case errc::store_failed: return "store_failed";
        case errc::cleanup_failed: return "cleanup_failed";
        case errc::auth_failed: return "auth_failed";
        case errc::broker_failed: return "broker_failed";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_timeout: return "net_timeout";
        case errc::net_eof: return "net_eof";
        case errc::net_cancelled: return "net_cancelled";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_io_failed: return "net_io_failed";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::imap_tagged_no: return "imap_tagged_no";
        case errc::imap_tagged_bad: return "imap_tagged_bad";
        case errc::imap_continuation_expected: return "imap_continuation_expected";
        case errc::imap_parse_error: return "imap_parse_error";
        case errc::imap_invalid_state: return "imap_invalid_state";
        case errc::imap_bye: return "imap_bye";
        case errc::mqtt_connack_refused: return "mqtt_connack_refused";
        case errc::mqtt_subscribe_refused: return "mqtt_subscribe_refused";
        case errc::mqtt_protocol_error: return "mqtt_protocol_error";
        case errc::mqtt_invalid_state: return "mqtt_invalid_state";
        case errc::oauth2_http_failed: return "oauth2_http_failed";
        case errc::oauth2_access_denied: return "oauth2_access_denied";
        case errc::oauth2_expired_token: return "oauth2_expired_token";
        case errc::oauth2_invalid_response: return "oauth2_invalid_response";
        case errc::oauth2_unknown_provider: return "oauth2_unknown_provider";
        case errc::oauth2_refresh_unavailable: return "oauth2_refresh_unavailable";
        case errc::sasl_xoauth2_error: return "sasl_xoauth2_error";
        case errc::codec_invalid_input: return "codec_invalid_input";
        case errc::invalid_argument: return "invalid_argument";
        case errc::internal_error: return "internal_error";
        case errc::cancelled: return "cancelled";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

/// True for the coarse kinds an account reports as its outcome.
[[nodiscard]] constexpr bool is_engine_kind(errc code) noexcept
{
    const auto value = static_cast<std::uint16_t>(code);
    return value >= 100 && value < 200;
}

struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where = std::source_location::current();
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = result<void>;

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info err)
{
    return std::unexpected<error_info>(std::move(err));
}

} // namespace detail

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
[[nodiscard]] result<T> fail(error_info err)
{
    return detail::make_unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, const detail::error_detail& detail,
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), detail.str(), sys, where));
}

/**
Attach a lower level failure to an engine error kind.

The cause's code, message and detail are kept in the resulting detail block so
that the original protocol failure stays visible. A cause that already carries
an engine kind is returned unchanged.
**/
[[nodiscard]] inline error_info nest_error(errc kind, std::string_view context, error_info cause,
    std::source_location where = std::source_location::current())
{
    if (is_engine_kind(cause.code))
        return cause;

    std::string message(context);
    if (!cause.message.empty())
    {
        message += ": ";
        message += cause.message;
    }

    detail::error_detail detail;
    detail.add("cause", to_string(cause.code));
    detail.merge("cause.", cause.detail);
    return error_info{kind, std::move(message), detail.str(), cause.sys, where};
}

[[nodiscard]] inline std::string format_error(const error_info& err)
{
    std::string out(to_string(err.code));
    if (!err.message.empty())
    {
        out += ": ";
        out += err.message;
    }
    return out;
}

} // namespace mailmirror

// ==================== Propagation Helpers ====================

/// Assign the value of a result expression or return its error from a coroutine.
/// Usage: MAILMIRROR_CO_TRY_ASSIGN(resp, co_await client.noop());
#define MAILMIRROR_CO_TRY_ASSIGN(lhs, expr) \
    do \
    { \
        auto&& mailmirror_try_res_ = (expr); \
        if (!mailmirror_try_res_) [[unlikely]] \
            co_return ::mailmirror::detail::make_unexpected(std::move(mailmirror_try_res_).error()); \
        lhs = std::move(*mailmirror_try_res_); \
    } while (0)

/// Await a result-returning awaitable and return its error from a coroutine.
#define MAILMIRROR_TRY_CO_AWAIT(expr) \
    do \
    { \
        auto mailmirror_try_res_ = co_await (expr); \
        if (!mailmirror_try_res_) [[unlikely]] \
            co_return ::mailmirror::detail::make_unexpected(std::move(mailmirror_try_res_).error()); \
    } while (0)

/// Same as MAILMIRROR_TRY_CO_AWAIT for a result that is already available.
#define MAILMIRROR_CO_TRY_VOID(expr) \
    do \
    { \
        auto&& mailmirror_try_res_ = (expr); \
        if (!mailmirror_try_res_) [[unlikely]] \
            co_return ::mailmirror::detail::make_unexpected(std::move(mailmirror_try_res_).error()); \
    } while (0)

/// Plain (non coroutine) variant.
#define MAILMIRROR_TRY(lhs, expr) \
    do \
    { \
        auto&& mailmirror_try_res_ = (expr); \
        if (!mailmirror_try_res_) [[unlikely]] \
            return ::mailmirror::detail::make_unexpected(std::move(mailmirror_try_res_).error()); \
        lhs = std::move(*mailmirror_try_res_); \
    } while (0)
