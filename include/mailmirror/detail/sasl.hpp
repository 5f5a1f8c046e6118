/*

sasl.hpp
--------

SASL helpers for mailmirror: base64 through OpenSSL and the XOAUTH2 mechanism.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

#include <openssl/evp.h>

#include <mailmirror/detail/json.hpp>
#include <mailmirror/detail/result.hpp>

namespace mailmirror::detail
{

/// Single-line base64 (no wrapping), as SASL requires.
[[nodiscard]] inline std::string base64_encode(std::string_view input)
{
    if (input.empty())
        return {};
    std::string out(4 * ((input.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size()));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

[[nodiscard]] inline result<std::string> base64_decode(std::string_view input)
{
    std::string clean;
    clean.reserve(input.size());
    for (char c : input)
    {
        if (c != '\r' && c != '\n' && c != ' ')
            clean.push_back(c);
    }
    if (clean.empty())
        return std::string{};
    if (clean.size() % 4 != 0)
        return fail<std::string>(errc::codec_invalid_input, "base64 input length is not a multiple of 4");

    std::string out(3 * clean.size() / 4, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(clean.data()), static_cast<int>(clean.size()));
    if (written < 0)
        return fail<std::string>(errc::codec_invalid_input, "invalid base64 input");

    // EVP_DecodeBlock counts padding bytes as output.
    std::size_t size = static_cast<std::size_t>(written);
    if (clean.back() == '=')
        --size;
    if (clean.size() >= 2 && clean[clean.size() - 2] == '=')
        --size;
    out.resize(size);
    return out;
}

} // namespace mailmirror::detail

namespace mailmirror::sasl
{

/**
 * Encode credentials for XOAUTH2 mechanism.
 * Format: user=<email>\x01auth=Bearer <token>\x01\x01 (then base64 encoded)
 */
[[nodiscard]] inline std::string encode_xoauth2(std::string_view username, std::string_view access_token)
{
    std::string xoauth2;
    xoauth2.reserve(5 + username.size() + 13 + access_token.size() + 2);
    xoauth2 += "user=";
    xoauth2 += username;
    xoauth2 += '\x01';
    xoauth2 += "auth=Bearer ";
    xoauth2 += access_token;
    xoauth2 += "\x01\x01";
    return ::mailmirror::detail::base64_encode(xoauth2);
}

/// Server error challenge sent after a rejected XOAUTH2 initial response.
struct xoauth2_error
{
    std::string status;
    std::string schemes;
    std::string scope;
};

/// Decode the base64 JSON challenge. An undecodable payload is reported as-is in `status`.
[[nodiscard]] inline xoauth2_error decode_xoauth2_error(std::string_view challenge)
{
    xoauth2_error out;
    auto raw = ::mailmirror::detail::base64_decode(challenge);
    if (!raw)
    {
        out.status = std::string(challenge);
        return out;
    }
    auto doc = ::mailmirror::detail::parse_json(*raw);
    if (!doc || !doc->isObject())
    {
        out.status = *raw;
        return out;
    }
    out.status = ::mailmirror::detail::json_string(*doc, "status");
    out.schemes = ::mailmirror::detail::json_string(*doc, "schemes");
    out.scope = ::mailmirror::detail::json_string(*doc, "scope");
    return out;
}

[[nodiscard]] inline error_info make_xoauth2_error(const xoauth2_error& challenge)
{
    ::mailmirror::detail::error_detail detail;
    detail.add("xoauth2.status", challenge.status);
    if (!challenge.schemes.empty())
        detail.add("xoauth2.schemes", challenge.schemes);
    if (!challenge.scope.empty())
        detail.add("xoauth2.scope", challenge.scope);
    return make_error(errc::sasl_xoauth2_error,
        "XOAUTH2 authentication error (" + challenge.status + ")", detail.str());
}

} // namespace mailmirror::sasl
