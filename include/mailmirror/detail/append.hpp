/*

append.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builders for IMAP command lines and sequence sets, appending in place.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace mailmirror::detail
{

inline void append_sv(std::string& out, std::string_view text)
{
    out += text;
}

inline void append_char(std::string& out, char ch)
{
    out += ch;
}

inline void append_space(std::string& out)
{
    out += ' ';
}

/// Decimal form of `value`; UIDs and literal sizes both fit.
inline void append_uint(std::string& out, std::uint64_t value)
{
    char digits[24];
    const auto [end, ec] = std::to_chars(digits, digits + sizeof(digits), value);
    out.append(digits, end);
}

} // namespace mailmirror::detail
