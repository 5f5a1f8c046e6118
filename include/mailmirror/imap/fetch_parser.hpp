/*

fetch_parser.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Parser for `* n FETCH (...)` records carrying UID, FLAGS, INTERNALDATE and
BODY[]. Literals are read by the client and referenced from the record text by
their `{size}` marker, in order of appearance.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/imap/types.hpp>

namespace mailmirror::imap
{

/// One untagged FETCH response, lines joined, literal payloads kept aside.
struct fetch_record
{
    std::string text;
    std::vector<std::string> literals;
};

struct fetched_message
{
    std::uint32_t seq = 0;
    std::uint32_t uid = 0;
    std::vector<std::string> flags;
    std::string internal_date;
    std::string body;
};

/// Receives each fetched message in order; returning false stops delivery.
using fetch_handler = std::function<mailmirror::asio::awaitable<bool>(fetched_message)>;

namespace detail
{

class fetch_cursor
{
public:
    fetch_cursor(std::string_view text, const std::vector<std::string>& literals)
        : text_(text), literals_(literals)
    {
    }

    void skip_spaces() noexcept
    {
        while (pos_ < text_.size() && text_[pos_] == ' ')
            ++pos_;
    }

    [[nodiscard]] bool at_end() const noexcept
    {
        return pos_ >= text_.size();
    }

    [[nodiscard]] char peek() const noexcept
    {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    bool consume(char ch) noexcept
    {
        skip_spaces();
        if (peek() != ch)
            return false;
        ++pos_;
        return true;
    }

    /// Attribute name; brackets such as `BODY[]` or `BODY[HEADER.FIELDS (A B)]` are kept whole.
    std::string_view key()
    {
        skip_spaces();
        const std::size_t start = pos_;
        int depth = 0;
        while (pos_ < text_.size())
        {
            const char ch = text_[pos_];
            if (ch == '[')
                ++depth;
            else if (ch == ']')
                --depth;
            else if (depth == 0 && (ch == ' ' || ch == '(' || ch == ')'))
                break;
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    std::string_view atom()
    {
        skip_spaces();
        const std::size_t start = pos_;
        while (pos_ < text_.size() && text_[pos_] != ' ' && text_[pos_] != ')' && text_[pos_] != '(')
            ++pos_;
        return text_.substr(start, pos_ - start);
    }

    bool quoted(std::string& out)
    {
        skip_spaces();
        if (peek() != '"')
            return false;
        ++pos_;
        out.clear();
        while (pos_ < text_.size())
        {
            const char ch = text_[pos_++];
            if (ch == '\\' && pos_ < text_.size())
            {
                out.push_back(text_[pos_++]);
                continue;
            }
            if (ch == '"')
                return true;
            out.push_back(ch);
        }
        return false;
    }

    /// `{n}` marker standing for the next literal.
    bool literal(std::string& out)
    {
        skip_spaces();
        if (peek() != '{')
            return false;
        const auto close = text_.find('}', pos_);
        if (close == std::string_view::npos)
            return false;
        pos_ = close + 1;
        if (next_literal_ >= literals_.size())
            return false;
        out = literals_[next_literal_++];
        return true;
    }

    /// nstring: quoted, literal or NIL.
    bool nstring(std::string& out)
    {
        skip_spaces();
        if (peek() == '"')
            return quoted(out);
        if (peek() == '{')
            return literal(out);
        const auto word = atom();
        if (mailmirror::detail::iequals_ascii(word, "NIL"))
        {
            out.clear();
            return true;
        }
        return false;
    }

    bool flag_list(std::vector<std::string>& out)
    {
        if (!consume('('))
            return false;
        out.clear();
        while (true)
        {
            skip_spaces();
            if (at_end())
                return false;
            if (peek() == ')')
            {
                ++pos_;
                return true;
            }
            const auto flag = atom();
            if (flag.empty())
                return false;
            out.emplace_back(flag);
        }
    }

    /// Skip a value of unknown shape, including nested lists.
    bool skip_value()
    {
        skip_spaces();
        std::string scratch;
        if (peek() == '"')
            return quoted(scratch);
        if (peek() == '{')
            return literal(scratch);
        if (peek() == '(')
        {
            ++pos_;
            while (true)
            {
                skip_spaces();
                if (at_end())
                    return false;
                if (peek() == ')')
                {
                    ++pos_;
                    return true;
                }
                if (!skip_value())
                    return false;
            }
        }
        return !atom().empty();
    }

private:
    std::string_view text_;
    const std::vector<std::string>& literals_;
    std::size_t pos_ = 0;
    std::size_t next_literal_ = 0;
};

} // namespace detail

/**
Parse a FETCH record. Returns nullopt for FETCH responses without a body
(e.g. unsolicited flag updates), an imap_parse_error for malformed input.
**/
[[nodiscard]] inline result<std::optional<fetched_message>> parse_fetch_record(const fetch_record& record)
{
    auto parse_error = [&record](std::string_view what)
    {
        auto detail = make_imap_detail({}, "FETCH", {}, 1, record.literals.size());
        detail.add("fetch.error", what);
        return fail<std::optional<fetched_message>>(errc::imap_parse_error, "Malformed FETCH response.", detail);
    };

    auto [star, rest] = detail::split_token(record.text);
    if (star != "*")
        return parse_error("missing untagged marker");
    auto [seq_token, rest2] = detail::split_token(rest);
    fetched_message msg;
    if (!detail::parse_uint32(seq_token, msg.seq))
        return parse_error("invalid sequence number");
    auto [fetch_word, items] = detail::split_token(rest2);
    if (!mailmirror::detail::iequals_ascii(fetch_word, "FETCH"))
        return parse_error("not a FETCH response");

    detail::fetch_cursor cur(items, record.literals);
    if (!cur.consume('('))
        return parse_error("missing attribute list");

    bool has_body = false;
    bool has_uid = false;
    while (true)
    {
        cur.skip_spaces();
        if (cur.at_end())
            return parse_error("unterminated attribute list");
        if (cur.consume(')'))
            break;

        const std::string key = detail::to_upper_ascii(cur.key());
        if (key.empty())
            return parse_error("empty attribute name");

        if (key == "UID")
        {
            if (!detail::parse_uint32(cur.atom(), msg.uid) || msg.uid == 0)
                return parse_error("invalid UID");
            has_uid = true;
        }
        else if (key == "FLAGS")
        {
            if (!cur.flag_list(msg.flags))
                return parse_error("invalid FLAGS");
        }
        else if (key == "INTERNALDATE")
        {
            if (!cur.nstring(msg.internal_date))
                return parse_error("invalid INTERNALDATE");
        }
        else if (key == "BODY[]" || key == "RFC822")
        {
            if (!cur.nstring(msg.body))
                return parse_error("invalid BODY[]");
            has_body = true;
        }
        else if (!cur.skip_value())
        {
            return parse_error("invalid attribute value");
        }
    }

    if (!has_body)
        return std::optional<fetched_message>{};
    if (!has_uid)
        return parse_error("missing UID");
    return std::optional<fetched_message>(std::move(msg));
}

} // namespace mailmirror::imap
