/*

authorization_server.hpp
------------------------

Client side of the OAuth2 device authorization grant (RFC 8628).

*/

#pragma once

#include <chrono>
#include <stop_token>
#include <string>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/oauth2/provider.hpp>
#include <mailmirror/oauth2/token.hpp>

namespace mailmirror::oauth2
{

struct device_challenge
{
    std::string device_code;
    std::string user_code;
    std::string verification_uri;
    std::chrono::seconds expires_in{0};
    std::chrono::seconds interval{0};
    std::string message;
};

/// Polling interval when the server does not announce one.
inline constexpr std::chrono::seconds DEFAULT_POLL_INTERVAL{5};

/// Added to the polling interval on every `slow_down` answer.
inline constexpr std::chrono::seconds SLOW_DOWN_STEP{5};

class authorization_server
{
public:
    virtual ~authorization_server() = default;

    /// Request a device and user code pair.
    virtual mailmirror::asio::awaitable<result<device_challenge>> device_auth(const provider& p) = 0;

    /**
    Poll the token endpoint until the user approved the challenge, denied it,
    the challenge expired or `stop` was requested.
    **/
    virtual mailmirror::asio::awaitable<result<token>> device_access_token(const provider& p,
        const device_challenge& challenge, std::stop_token stop) = 0;

    /// Exchange a refresh token for a fresh access token.
    virtual mailmirror::asio::awaitable<result<token>> refresh(const provider& p, const std::string& refresh_token) = 0;
};

} // namespace mailmirror::oauth2
