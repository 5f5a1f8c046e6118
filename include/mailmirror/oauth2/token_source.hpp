/*

token_source.hpp
----------------

Token source for the device authorization grant. Tokens live only in the
backend; every call goes through load, optional device flow, refresh and save.

*/

#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/oauth2/authorization_server.hpp>
#include <mailmirror/oauth2/provider.hpp>
#include <mailmirror/oauth2/token.hpp>
#include <mailmirror/oauth2/token_backend.hpp>

namespace mailmirror::oauth2
{

class token_source
{
public:
    using token_type = mailmirror::oauth2::token;

    token_source(std::shared_ptr<authorization_server> server, std::shared_ptr<token_backend> backend,
        provider_table providers, std::string provider_name, std::string name)
        : server_(std::move(server)),
          backend_(std::move(backend)),
          providers_(std::move(providers)),
          provider_name_(std::move(provider_name)),
          name_(std::move(name))
    {
    }

    /// A live token or an error; never an expired token.
    mailmirror::asio::awaitable<result<token_type>> token(std::stop_token stop)
    {
        auto found = find_provider(providers_, provider_name_);
        if (!found)
            co_return fail<token_type>(nest_error(errc::auth_failed, "token source", std::move(found).error()));
        const provider& prov = *found;

        std::optional<token_type> current;
        MAILMIRROR_CO_TRY_ASSIGN(current, co_await backend_->load_token(stop));

        if (!current.has_value())
        {
            MAILMIRROR_INFO("{}: no stored token, starting device authorization with {}", name_, prov.name);

            auto challenge = co_await server_->device_auth(prov);
            if (!challenge)
                co_return fail<token_type>(nest_error(errc::auth_failed, "device authorization request failed",
                    std::move(challenge).error()));

            MAILMIRROR_TRY_CO_AWAIT(backend_->notify(*challenge));

            auto granted = co_await server_->device_access_token(prov, *challenge, stop);
            if (!granted)
                co_return fail<token_type>(nest_error(errc::auth_failed, "device authorization failed",
                    std::move(granted).error()));
            current = std::move(*granted);
        }

        if (!current->valid(clock_type::now()))
        {
            MAILMIRROR_DEBUG("{}: token expired, refreshing", name_);
            auto refreshed = co_await server_->refresh(prov, current->refresh_token);
            if (!refreshed)
                co_return fail<token_type>(nest_error(errc::auth_failed, "token refresh failed",
                    std::move(refreshed).error()));
            if (refreshed->refresh_token.empty())
                refreshed->refresh_token = current->refresh_token;
            current = std::move(*refreshed);

            if (!current->valid(clock_type::now()))
                co_return fail<token_type>(errc::auth_failed, "refreshed token is already expired");
        }

        MAILMIRROR_TRY_CO_AWAIT(backend_->save_token(*current));
        co_return ok(std::move(*current));
    }

private:
    std::shared_ptr<authorization_server> server_;
    std::shared_ptr<token_backend> backend_;
    provider_table providers_;
    std::string provider_name_;
    std::string name_;
};

} // namespace mailmirror::oauth2
