/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

#include <mailmirror/detail/result.hpp>

namespace mailmirror::detail
{

/// Mailbox names, usernames and host names are sent on one command line; CR, LF and NUL would split it.
[[nodiscard]] inline result_void ensure_no_crlf_or_nul(std::string_view value, const char* field_name)
{
    if (value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos)
        return ok();

    error_detail detail;
    detail.add("field", field_name != nullptr ? field_name : "value");
    return fail<void>(errc::invalid_argument,
        std::string(field_name != nullptr ? field_name : "value") + " contains CR, LF or NUL", detail);
}

} // namespace mailmirror::detail
