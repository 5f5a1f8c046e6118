/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <mailmirror/detail/append.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/detail/sanitize.hpp>
#include <mailmirror/net/dialog.hpp>
#include <mailmirror/net/tls_options.hpp>

namespace mailmirror::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

/// Quote `text` as an IMAP quoted string.
[[nodiscard]] inline result<std::string> to_astring(std::string_view text)
{
    if (auto checked = mailmirror::detail::ensure_no_crlf_or_nul(text, "astring"); !checked)
        return fail<std::string>(std::move(checked).error());
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

struct mailbox_stat
{
    std::uint32_t messages_no = 0;
    std::uint32_t recent = 0;
    std::uint32_t unseen = 0;
    std::uint32_t uid_next = 0;
    std::uint32_t uid_validity = 0;
};

namespace detail
{
    [[nodiscard]] inline std::string_view ltrim(std::string_view text)
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        return text;
    }

    [[nodiscard]] inline std::pair<std::string_view, std::string_view> split_token(std::string_view text)
    {
        text = ltrim(text);
        auto pos = text.find(' ');
        if (pos == std::string_view::npos)
            return {text, std::string_view{}};
        return {text.substr(0, pos), ltrim(text.substr(pos + 1))};
    }

    [[nodiscard]] inline bool parse_uint32(std::string_view token, std::uint32_t& out)
    {
        if (token.empty())
            return false;
        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size())
            return false;
        out = value;
        return true;
    }

    [[nodiscard]] inline std::string to_upper_ascii(std::string_view input)
    {
        std::string out;
        out.reserve(input.size());
        for (char ch : input)
        {
            if (ch >= 'a' && ch <= 'z')
                out.push_back(static_cast<char>(ch - ('a' - 'A')));
            else
                out.push_back(ch);
        }
        return out;
    }

    /// `APPEND <mailbox> [(flags)] ["date"] {size[+]}`
    [[nodiscard]] inline result<std::string> build_append_command(std::string_view mailbox, std::size_t size,
        std::string_view flags, std::string_view date_time, bool literal_plus)
    {
        std::string mailbox_q;
        MAILMIRROR_TRY(mailbox_q, to_astring(mailbox));
        if (auto checked = mailmirror::detail::ensure_no_crlf_or_nul(flags, "flags"); !checked)
            return fail<std::string>(std::move(checked).error());

        std::string cmd;
        mailmirror::detail::append_sv(cmd, "APPEND");
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_sv(cmd, mailbox_q);
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_char(cmd, '(');
        mailmirror::detail::append_sv(cmd, flags);
        mailmirror::detail::append_char(cmd, ')');
        if (!date_time.empty())
        {
            std::string dt;
            MAILMIRROR_TRY(dt, to_astring(date_time));
            mailmirror::detail::append_space(cmd);
            mailmirror::detail::append_sv(cmd, dt);
        }
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_char(cmd, '{');
        mailmirror::detail::append_uint(cmd, static_cast<std::uint64_t>(size));
        if (literal_plus)
            mailmirror::detail::append_char(cmd, '+');
        mailmirror::detail::append_char(cmd, '}');
        return cmd;
    }
} // namespace detail

[[nodiscard]] inline bool parse_counted(std::string_view line, std::string_view keyword, std::uint32_t& out)
{
    line = detail::ltrim(line);
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return false;
    auto [num, rest2] = detail::split_token(rest);
    std::uint32_t value = 0;
    if (!detail::parse_uint32(num, value))
        return false;
    auto [word, rest3] = detail::split_token(rest2);
    (void)rest3;
    if (!mailmirror::detail::iequals_ascii(word, keyword))
        return false;
    out = value;
    return true;
}

[[nodiscard]] inline bool parse_exists(std::string_view line, std::uint32_t& out)
{
    return parse_counted(line, "EXISTS", out);
}

[[nodiscard]] inline bool parse_recent(std::string_view line, std::uint32_t& out)
{
    return parse_counted(line, "RECENT", out);
}

[[nodiscard]] inline bool parse_ok_item(std::string_view line, std::string_view key, std::uint32_t& out)
{
    line = detail::ltrim(line);
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return false;
    auto [ok_word, rest2] = detail::split_token(rest);
    if (!mailmirror::detail::iequals_ascii(ok_word, "OK"))
        return false;
    rest2 = detail::ltrim(rest2);
    if (rest2.empty() || rest2.front() != '[')
        return false;
    auto close = rest2.find(']');
    if (close == std::string_view::npos)
        return false;
    std::string_view inner = rest2.substr(1, close - 1);
    auto [inner_key, inner_rest] = detail::split_token(inner);
    if (!mailmirror::detail::iequals_ascii(inner_key, key))
        return false;
    auto [value_token, ignored] = detail::split_token(inner_rest);
    (void)ignored;
    return detail::parse_uint32(value_token, out);
}

inline void parse_mailbox_stat(std::string_view line, mailbox_stat& stat)
{
    std::uint32_t value = 0;
    if (parse_exists(line, value))
        stat.messages_no = value;
    else if (parse_recent(line, value))
        stat.recent = value;
    else if (parse_ok_item(line, "UNSEEN", value))
        stat.unseen = value;
    else if (parse_ok_item(line, "UIDNEXT", value))
        stat.uid_next = value;
    else if (parse_ok_item(line, "UIDVALIDITY", value))
        stat.uid_validity = value;
}

struct response
{
    std::string tag;
    status st = status::unknown;
    std::string text;
    std::vector<std::string> untagged_lines;
    std::vector<std::string> continuation;
    std::vector<std::string> tagged_lines;
    std::vector<std::string> literals;
};

/// Detail block of a failed IMAP exchange; credentials in `command` are masked.
[[nodiscard]] inline mailmirror::detail::error_detail make_imap_detail(std::string_view tag, std::string_view command,
    std::string_view tagged_line, std::size_t untagged_count, std::size_t literals_count)
{
    mailmirror::detail::error_detail detail;
    detail.add("proto", "imap");
    if (!tag.empty())
        detail.add("tag", tag);
    detail.add_redacted("command", command);
    if (!tagged_line.empty())
        detail.add("tagged.line", tagged_line);
    detail.add_int("untagged.count", untagged_count).add_int("literals.count", literals_count);
    return detail;
}

struct options
{
    std::size_t max_line_length = mailmirror::net::DEFAULT_MAX_LINE_LENGTH;
    std::optional<std::chrono::steady_clock::duration> timeout = std::nullopt;
    mailmirror::net::tls_options tls;
    bool redact_secrets_in_trace = true;
};

/// Kinds of untagged server data surfaced while idling.
enum class event_kind
{
    mailbox_status,
    expunge,
    message,
    status,
    other
};

[[nodiscard]] constexpr std::string_view to_string(event_kind kind) noexcept
{
    switch (kind)
    {
        case event_kind::mailbox_status: return "mailbox_status";
        case event_kind::expunge: return "expunge";
        case event_kind::message: return "message";
        case event_kind::status: return "status";
        case event_kind::other: return "other";
    }
    return "other";
}

struct event
{
    event_kind kind = event_kind::other;
    std::string line;
};

/**
Classify an untagged line (`* ...`). BYE is reported separately by
is_bye_line() since it ends the session.
**/
[[nodiscard]] inline event_kind classify_untagged(std::string_view line)
{
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return event_kind::other;
    auto [first, tail] = detail::split_token(rest);

    std::uint32_t number = 0;
    if (detail::parse_uint32(first, number))
    {
        auto [word, ignored] = detail::split_token(tail);
        (void)ignored;
        if (mailmirror::detail::iequals_ascii(word, "EXISTS") || mailmirror::detail::iequals_ascii(word, "RECENT"))
            return event_kind::mailbox_status;
        if (mailmirror::detail::iequals_ascii(word, "EXPUNGE"))
            return event_kind::expunge;
        if (mailmirror::detail::iequals_ascii(word, "FETCH"))
            return event_kind::message;
        return event_kind::other;
    }

    if (mailmirror::detail::iequals_ascii(first, "FLAGS"))
        return event_kind::mailbox_status;
    if (mailmirror::detail::iequals_ascii(first, "OK") || mailmirror::detail::iequals_ascii(first, "NO")
        || mailmirror::detail::iequals_ascii(first, "BAD"))
        return event_kind::status;
    return event_kind::other;
}

[[nodiscard]] inline bool is_bye_line(std::string_view line)
{
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return false;
    auto [word, ignored] = detail::split_token(rest);
    (void)ignored;
    return mailmirror::detail::iequals_ascii(word, "BYE");
}

} // namespace mailmirror::imap
