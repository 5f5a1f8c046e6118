/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/net/error_mapping.hpp>
#include <mailmirror/net/tls_options.hpp>

namespace mailmirror::net
{

namespace ssl = mailmirror::asio::ssl;
using mailmirror::asio::tcp;

/**
One stream type for plain and TLS sessions. IMAP stores switch to TLS right
after the TCP connect; the broker link does so only when configured.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = mailmirror::asio::any_io_executor;
    using lowest_layer_type = tcp::socket::lowest_layer_type;

    explicit upgradable_stream(executor_type executor)
        : stream_(std::in_place_type<tcp::socket>, std::move(executor))
    {
    }

    executor_type get_executor()
    {
        return lowest_layer().get_executor();
    }

    lowest_layer_type& lowest_layer()
    {
        if (auto* tls = std::get_if<ssl_stream>(&stream_))
            return tls->lowest_layer();
        return std::get<tcp::socket>(stream_).lowest_layer();
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return stream_.index() == 1;
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /// Wrap the connected socket in TLS and run the client handshake against `host`.
    mailmirror::asio::awaitable<result_void> start_tls(ssl::context& context, const std::string& host,
        const tls_options& opt)
    {
        if (is_tls())
            co_return ok();
        if (opt.verify == verify_mode::peer && opt.verify_host && host.empty())
            co_return fail<void>(errc::tls_verify_failed, "TLS host name verification needs a host name");

        tcp::socket socket = std::get<tcp::socket>(std::move(stream_));
        auto& tls = stream_.emplace<ssl_stream>(std::move(socket), context);
        if (!host.empty())
            SSL_set_tlsext_host_name(tls.native_handle(), host.c_str());
        install_verifier(tls, host, opt);

        mailmirror::asio::error_code ec;
        co_await tls.async_handshake(ssl::stream_base::client,
            mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
        if (ec)
        {
            co_return fail<void>(make_net_error(io_stage::handshake, ec,
                make_net_detail("tls", host, {}, io_stage::handshake, "async_handshake")));
        }
        co_return ok();
    }

    /// Close the socket; errors are irrelevant at this point.
    void close() noexcept
    {
        mailmirror::asio::error_code ignored;
        lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
        lowest_layer().close(ignored);
    }

private:
    static void install_verifier(ssl_stream& tls, const std::string& host, const tls_options& opt)
    {
        if (opt.verify == verify_mode::none)
        {
            tls.set_verify_mode(ssl::verify_none);
            return;
        }
        tls.set_verify_mode(ssl::verify_peer);

        const bool self_signed = opt.allow_self_signed;
        std::function<bool(bool, ssl::verify_context&)> name_check;
        if (opt.verify_host)
            name_check = ssl::host_name_verification(host);
        if (!name_check && !self_signed)
            return;

        tls.set_verify_callback([self_signed, name_check](bool preverified, ssl::verify_context& ctx)
        {
            if (!preverified && !(self_signed && is_self_signed_failure(ctx)))
                return false;
            return name_check ? name_check(true, ctx) : true;
        });
    }

    [[nodiscard]] static bool is_self_signed_failure(ssl::verify_context& ctx) noexcept
    {
        X509_STORE_CTX* store = ctx.native_handle();
        if (store == nullptr)
            return false;
        const int err = X509_STORE_CTX_get_error(store);
        return err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN || err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT;
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace mailmirror::net
