/*

token_backend.hpp
-----------------

Persistence and user notification for the device authorization grant.

*/

#pragma once

#include <optional>
#include <stop_token>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/oauth2/authorization_server.hpp>
#include <mailmirror/oauth2/token.hpp>

namespace mailmirror::oauth2
{

class token_backend
{
public:
    virtual ~token_backend() = default;

    /// Cached token, or nullopt when none is stored or `stop` was requested while waiting.
    virtual mailmirror::asio::awaitable<result<std::optional<token>>> load_token(std::stop_token stop) = 0;

    virtual mailmirror::asio::awaitable<result_void> save_token(const token& tok) = 0;

    /// Tell the user which code to enter where.
    virtual mailmirror::asio::awaitable<result_void> notify(const device_challenge& challenge) = 0;
};

} // namespace mailmirror::oauth2
