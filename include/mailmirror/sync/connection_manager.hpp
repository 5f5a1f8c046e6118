/*

connection_manager.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Opens and closes authenticated IMAP sessions for one account.

*/

#pragma once

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/imap/client.hpp>
#include <mailmirror/imap/types.hpp>
#include <mailmirror/net/connect.hpp>
#include <mailmirror/oauth2/token_source.hpp>
#include <mailmirror/sync/account.hpp>

namespace mailmirror::sync
{

enum class open_mode
{
    /// Authenticated, no mailbox selected; I/O bounded by the session timeout.
    plain,
    /// Mailbox selected and no I/O timeout, for a session that sits in IDLE.
    idle
};

inline constexpr const char* DEFAULT_IMAPS_PORT = "993";
inline constexpr std::chrono::minutes DEFAULT_SESSION_TIMEOUT{5};

/**
Session factory over IMAP with implicit TLS. Password stores use LOGIN; OAuth2
stores fetch a token from their token source and use AUTHENTICATE XOAUTH2.
**/
class connection_manager
{
public:
    using session_type = mailmirror::imap::client;

    connection_manager(mailmirror::asio::any_io_executor executor, const account& acct,
        mailmirror::asio::ssl::context& tls_ctx, mailmirror::imap::options options,
        std::shared_ptr<mailmirror::oauth2::token_source> source_tokens,
        std::shared_ptr<mailmirror::oauth2::token_source> target_tokens)
        : executor_(std::move(executor)),
          account_(acct),
          tls_ctx_(tls_ctx),
          options_(std::move(options)),
          source_tokens_(std::move(source_tokens)),
          target_tokens_(std::move(target_tokens))
    {
    }

    mailmirror::asio::awaitable<result<std::unique_ptr<session_type>>> open(store_role role, open_mode mode,
        std::stop_token stop)
    {
        using session_ptr = std::unique_ptr<session_type>;
        const mail_store_credentials& store = account_.store(role);

        std::pair<std::string, std::string> address;
        {
            auto split = mailmirror::net::split_host_port(store.server, DEFAULT_IMAPS_PORT);
            if (!split)
                co_return fail<session_ptr>(nest_error(errc::connection_failed, "invalid server address",
                    std::move(split).error()));
            address = std::move(*split);
        }

        mailmirror::imap::options opts = options_;
        if (mode == open_mode::idle)
            opts.timeout.reset();
        else if (!opts.timeout.has_value())
            opts.timeout = DEFAULT_SESSION_TIMEOUT;

        auto session = std::make_unique<session_type>(executor_, std::move(opts));
        MAILMIRROR_DEBUG("{}: connecting to {} {}", account_.prefix(), to_string(role), store.server);

        auto connected = co_await session->connect(address.first, address.second, &tls_ctx_);
        if (!connected)
            co_return fail<session_ptr>(nest_error(errc::connection_failed,
                fmt::format("cannot connect to {}", store.server), std::move(connected).error()));

        auto authenticated = co_await authenticate(*session, role, store, stop);
        if (!authenticated)
        {
            session->disconnect();
            co_return fail<session_ptr>(std::move(authenticated).error());
        }

        if (mode == open_mode::idle)
        {
            auto selected = co_await session->select(store.mailbox);
            if (!selected)
            {
                auto closed = co_await close(*session);
                if (!closed)
                    MAILMIRROR_WARN("{}: {}", account_.prefix(), format_error(closed.error()));
                co_return fail<session_ptr>(nest_error(errc::connection_failed,
                    fmt::format("cannot select {}", store.mailbox), std::move(selected).error()));
            }
        }
        co_return ok(std::move(session));
    }

    /// LOGOUT and drop the transport; the transport is dropped even when LOGOUT fails.
    mailmirror::asio::awaitable<result_void> close(session_type& session)
    {
        if (!session.connected())
            co_return ok();
        auto res = co_await session.logout();
        session.disconnect();
        if (!res)
            co_return fail<void>(nest_error(errc::connection_failed, "logout failed", std::move(res).error()));
        co_return ok();
    }

private:
    mailmirror::asio::awaitable<result_void> authenticate(session_type& session, store_role role,
        const mail_store_credentials& store, std::stop_token stop)
    {
        if (store.auth == auth_mode::password)
        {
            auto res = co_await session.login(store.username, store.password);
            if (!res)
                co_return fail<void>(nest_error(errc::connection_failed,
                    fmt::format("login as {} failed", store.username), std::move(res).error()));
            co_return ok();
        }

        const auto& tokens = role == store_role::source ? source_tokens_ : target_tokens_;
        if (!tokens)
            co_return fail<void>(errc::auth_failed, fmt::format("no token source for {} store", to_string(role)));

        auto tok = co_await tokens->token(stop);
        if (!tok)
            co_return fail<void>(std::move(tok).error());

        auto res = co_await session.authenticate_xoauth2(store.username, tok->access_token);
        if (!res)
            co_return fail<void>(nest_error(errc::connection_failed,
                fmt::format("XOAUTH2 authentication as {} failed", store.username), std::move(res).error()));
        co_return ok();
    }

    mailmirror::asio::any_io_executor executor_;
    const account& account_;
    mailmirror::asio::ssl::context& tls_ctx_;
    mailmirror::imap::options options_;
    std::shared_ptr<mailmirror::oauth2::token_source> source_tokens_;
    std::shared_ptr<mailmirror::oauth2::token_source> target_tokens_;
};

} // namespace mailmirror::sync
