/*

connect.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/detail/sanitize.hpp>
#include <mailmirror/net/error_mapping.hpp>
#include <mailmirror/net/tls_options.hpp>
#include <mailmirror/net/upgradable_stream.hpp>

namespace mailmirror::net
{

/**
Resolve `host`, connect, and optionally upgrade to TLS straight away
(implicit TLS). `proto` only labels error details.
**/
inline mailmirror::asio::awaitable<result<upgradable_stream>> open_stream(
    mailmirror::asio::any_io_executor executor,
    std::string host,
    std::string service,
    mailmirror::asio::ssl::context* tls_ctx,
    tls_options tls,
    std::string_view proto)
{
    MAILMIRROR_CO_TRY_VOID(mailmirror::detail::ensure_no_crlf_or_nul(host, "host"));
    MAILMIRROR_CO_TRY_VOID(mailmirror::detail::ensure_no_crlf_or_nul(service, "service"));

    mailmirror::asio::tcp::resolver resolver(executor);
    mailmirror::asio::error_code ec;
    auto endpoints = co_await resolver.async_resolve(host, service,
        mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
    if (ec)
        co_return fail<upgradable_stream>(make_net_error(io_stage::resolve, ec,
            make_net_detail(proto, host, service, io_stage::resolve, "async_resolve")));

    upgradable_stream stream(executor);
    co_await mailmirror::asio::async_connect(stream.lowest_layer(), endpoints,
        mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
    if (ec)
        co_return fail<upgradable_stream>(make_net_error(io_stage::connect, ec,
            make_net_detail(proto, host, service, io_stage::connect, "async_connect")));

    if (tls_ctx != nullptr)
    {
        auto tls_res = co_await stream.start_tls(*tls_ctx, host, tls);
        if (!tls_res)
            co_return fail<upgradable_stream>(std::move(tls_res).error());
    }

    co_return ok(std::move(stream));
}

/// Split "host:port"; a missing port yields `default_port`.
[[nodiscard]] inline result<std::pair<std::string, std::string>> split_host_port(
    std::string_view address, std::string_view default_port)
{
    if (address.empty())
        return fail<std::pair<std::string, std::string>>(errc::invalid_argument, "empty server address");

    std::string host;
    std::string port;
    if (address.front() == '[')
    {
        const auto close = address.find(']');
        if (close == std::string_view::npos)
            return fail<std::pair<std::string, std::string>>(errc::invalid_argument,
                "unterminated IPv6 literal", std::string("address=") + std::string(address) + "\n");
        host.assign(address.substr(1, close - 1));
        std::string_view rest = address.substr(close + 1);
        if (!rest.empty() && rest.front() == ':')
            port.assign(rest.substr(1));
    }
    else
    {
        const auto colon = address.rfind(':');
        if (colon == std::string_view::npos)
        {
            host.assign(address);
        }
        else
        {
            host.assign(address.substr(0, colon));
            port.assign(address.substr(colon + 1));
        }
    }

    if (host.empty())
        return fail<std::pair<std::string, std::string>>(errc::invalid_argument,
            "missing host", std::string("address=") + std::string(address) + "\n");
    if (port.empty())
        port.assign(default_port);
    for (char ch : port)
    {
        if (ch < '0' || ch > '9')
            return fail<std::pair<std::string, std::string>>(errc::invalid_argument,
                "invalid port", std::string("address=") + std::string(address) + "\n");
    }
    return std::make_pair(std::move(host), std::move(port));
}

} // namespace mailmirror::net
