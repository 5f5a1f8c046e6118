/*

error_mapping.hpp
-----------------

Classification of Asio failures on IMAP and MQTT transports.

*/

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/result.hpp>

namespace mailmirror::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

namespace detail
{

struct stage_traits
{
    std::string_view name;
    errc fallback;
};

inline constexpr std::array<stage_traits, 5> STAGES{{
    {"resolve", errc::net_resolve_failed},
    {"connect", errc::net_connect_failed},
    {"read", errc::net_io_failed},
    {"write", errc::net_io_failed},
    {"handshake", errc::tls_handshake_failed},
}};

[[nodiscard]] constexpr const stage_traits& traits(io_stage stage) noexcept
{
    return STAGES[static_cast<std::size_t>(stage)];
}

} // namespace detail

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    return detail::traits(stage).name;
}

/// Conditions that mean the same thing at any stage win over the stage's own kind.
[[nodiscard]] inline errc map_net_error(io_stage stage, const mailmirror::asio::error_code& ec) noexcept
{
    namespace aerr = mailmirror::asio::error;

    if (ec == aerr::operation_aborted)
        return errc::net_cancelled;
    if (ec == aerr::timed_out)
        return errc::net_timeout;
    if (ec == aerr::eof || ec == mailmirror::asio::ssl::error::stream_truncated)
        return errc::net_eof;
    if (ec == aerr::connection_refused)
        return errc::net_connection_refused;
    if (ec == aerr::connection_reset || ec == aerr::broken_pipe)
        return errc::net_connection_reset;
    if (ec == aerr::host_not_found || ec == aerr::host_not_found_try_again)
        return errc::net_resolve_failed;
    return detail::traits(stage).fallback;
}

[[nodiscard]] inline mailmirror::detail::error_detail make_net_detail(std::string_view proto, std::string_view host,
    std::string_view service, io_stage stage, std::string_view op)
{
    mailmirror::detail::error_detail detail;
    detail.add("proto", proto);
    if (!host.empty())
        detail.add("host", host);
    if (!service.empty())
        detail.add("service", service);
    detail.add("stage", stage_name(stage)).add("op", op);
    return detail;
}

[[nodiscard]] inline error_info make_net_error(io_stage stage, const mailmirror::asio::error_code& ec,
    mailmirror::detail::error_detail detail, std::source_location where = std::source_location::current())
{
    const std::error_code sys(ec);
    detail.add_ec("asio", sys);
    return make_error(map_net_error(stage, ec), fmt::format("network {} failed: {}", stage_name(stage), ec.message()),
        detail.str(), sys, where);
}

} // namespace mailmirror::net
