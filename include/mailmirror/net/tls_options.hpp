/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/result.hpp>

namespace mailmirror::net
{

enum class verify_mode
{
    none,
    peer
};

/// Peer verification applied to IMAP and MQTT TLS sessions.
struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    bool allow_self_signed = false;
};

/**
Prepare the client context shared by every IMAP and broker session: trust
anchors from the system paths and `ca_files`, and the minimum protocol version.
Called once before the first connection.
**/
inline result_void prepare_client_context(mailmirror::asio::ssl::context& ctx, const tls_options& options)
{
    mailmirror::asio::error_code ec;
    if (options.use_default_verify_paths)
        ctx.set_default_verify_paths(ec);

    for (auto file = options.ca_files.begin(); !ec && file != options.ca_files.end(); ++file)
    {
        if (!file->empty())
            ctx.load_verify_file(*file, ec);
    }
    if (ec)
        return fail<void>(errc::tls_verify_failed, "cannot load the TLS trust store", ec.message(), ec);

    if (options.min_tls_version && SSL_CTX_set_min_proto_version(ctx.native_handle(), *options.min_tls_version) != 1)
    {
        char reason[256]{};
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        return fail<void>(errc::tls_handshake_failed, "cannot set the minimum TLS version", reason);
    }
    return ok();
}

} // namespace mailmirror::net
