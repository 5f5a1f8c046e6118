/*

redact.hpp
----------

Masking of credentials in protocol lines before they are traced or attached
to an error.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace mailmirror::detail
{

inline constexpr std::string_view REDACTED = "<redacted>";

[[nodiscard]] constexpr char ascii_upper(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') ? static_cast<char>(ch - 'a' + 'A') : ch;
}

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return ascii_upper(x) == ascii_upper(y); });
}

namespace redact_impl
{

/// Position just past the n-th space separated word of `line`, or npos.
[[nodiscard]] inline std::size_t after_word(std::string_view line, std::size_t n) noexcept
{
    std::size_t pos = 0;
    for (std::size_t i = 0; i < n; ++i)
    {
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string_view::npos)
            return pos;
        pos = line.find(' ', pos);
        if (pos == std::string_view::npos)
            return pos;
    }
    return pos;
}

[[nodiscard]] inline std::string_view word_at(std::string_view line, std::size_t n) noexcept
{
    const std::size_t start = n == 0 ? 0 : after_word(line, n);
    if (start == std::string_view::npos)
        return {};
    const std::size_t first = line.find_first_not_of(' ', start);
    if (first == std::string_view::npos)
        return {};
    return line.substr(first, line.find(' ', first) - first);
}

/// A SASL continuation: one base64 word, long enough or carrying base64 only characters.
[[nodiscard]] inline bool is_sasl_continuation(std::string_view line) noexcept
{
    if (line.empty() || line.find(' ') != std::string_view::npos)
        return false;
    bool marked = false;
    for (char ch : line)
    {
        const bool alpha = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
        const bool marker = (ch >= '0' && ch <= '9') || ch == '+' || ch == '/' || ch == '=';
        if (!alpha && !marker)
            return false;
        marked = marked || marker;
    }
    return marked || line.size() >= 12;
}

} // namespace redact_impl

/**
Replace the secret part of an outgoing IMAP command.

`<tag> LOGIN <user> <password>` keeps the user, `<tag> AUTHENTICATE <mech> <ir>`
keeps the mechanism, and a bare base64 continuation is masked entirely. Any
other line is returned unchanged, line terminator included.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    const std::size_t body_end = line.find_last_not_of("\r\n");
    if (body_end == std::string_view::npos)
        return std::string(line);
    const std::string_view body = line.substr(0, body_end + 1);
    const std::string_view eol = line.substr(body_end + 1);

    const std::string_view command = redact_impl::word_at(body, 1);
    if (iequals_ascii(command, "LOGIN") || iequals_ascii(command, "AUTHENTICATE"))
    {
        const std::size_t keep = redact_impl::after_word(body, 3);
        if (keep == std::string_view::npos || redact_impl::word_at(body, 3).empty())
            return std::string(line);
        std::string out(body.substr(0, keep));
        out += ' ';
        out += REDACTED;
        out += eol;
        return out;
    }

    const std::size_t lead = body.find_first_not_of(' ');
    if (lead != std::string_view::npos && redact_impl::is_sasl_continuation(body.substr(lead)))
        return std::string(body.substr(0, lead)) + std::string(REDACTED) + std::string(eol);
    return std::string(line);
}

} // namespace mailmirror::detail
