/*

token.hpp
---------

OAuth2 bearer token with the JSON layout used on the token broker.

*/

#pragma once

#include <charconv>
#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <json/json.h>

#include <mailmirror/detail/json.hpp>
#include <mailmirror/detail/result.hpp>

namespace mailmirror::oauth2
{

using clock_type = std::chrono::system_clock;

/// Tokens are treated as expired this long before their nominal expiry.
inline constexpr std::chrono::seconds EXPIRY_SKEW{10};

struct token
{
    std::string access_token;
    std::string token_type;
    std::string refresh_token;
    std::optional<clock_type::time_point> expiry;

    [[nodiscard]] bool valid(clock_type::time_point now) const noexcept
    {
        if (access_token.empty())
            return false;
        if (!expiry.has_value())
            return true;
        return *expiry - EXPIRY_SKEW > now;
    }
};

namespace detail
{

inline constexpr std::string_view ZERO_TIME = "0001-01-01T00:00:00Z";

[[nodiscard]] inline bool parse_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) noexcept
{
    if (pos + count > text.size())
        return false;
    const char* first = text.data() + pos;
    const char* last = first + count;
    for (const char* p = first; p != last; ++p)
    {
        if (*p < '0' || *p > '9')
            return false;
    }
    return std::from_chars(first, last, out).ec == std::errc{};
}

} // namespace detail

/// RFC 3339 in UTC with the shortest exact fractional part.
[[nodiscard]] inline std::string format_rfc3339(clock_type::time_point tp)
{
    const auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs).count();
    if (nanos < 0)
    {
        secs -= std::chrono::seconds{1};
        nanos += 1000000000;
    }

    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::string out = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    if (nanos != 0)
    {
        std::string frac = fmt::format("{:09}", nanos);
        while (!frac.empty() && frac.back() == '0')
            frac.pop_back();
        out += '.';
        out += frac;
    }
    out += 'Z';
    return out;
}

/**
Parse an RFC 3339 timestamp such as `2025-03-01T10:00:00.5+01:00`.
Years before 2 denote the zero time and yield no expiry.
**/
[[nodiscard]] inline result<std::optional<clock_type::time_point>> parse_rfc3339(std::string_view text)
{
    using R = result<std::optional<clock_type::time_point>>;
    const auto invalid = [&text]() -> R
    {
        mailmirror::detail::error_detail detail;
        detail.add("value", text);
        return fail<std::optional<clock_type::time_point>>(errc::codec_invalid_input, "invalid RFC 3339 timestamp", detail);
    };

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (text.size() < 20
        || !detail::parse_digits(text, 0, 4, year) || text[4] != '-'
        || !detail::parse_digits(text, 5, 2, month) || text[7] != '-'
        || !detail::parse_digits(text, 8, 2, day) || (text[10] != 'T' && text[10] != 't')
        || !detail::parse_digits(text, 11, 2, hour) || text[13] != ':'
        || !detail::parse_digits(text, 14, 2, minute) || text[16] != ':'
        || !detail::parse_digits(text, 17, 2, second))
        return invalid();

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
        return invalid();

    std::size_t pos = 19;
    long long nanos = 0;
    if (text[pos] == '.')
    {
        ++pos;
        const std::size_t start = pos;
        long long scale = 100000000;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        {
            nanos += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start)
            return invalid();
    }

    if (pos >= text.size())
        return invalid();

    int offset_seconds = 0;
    if (text[pos] == 'Z' || text[pos] == 'z')
    {
        ++pos;
    }
    else if (text[pos] == '+' || text[pos] == '-')
    {
        const int sign = text[pos] == '-' ? -1 : 1;
        int off_h = 0, off_m = 0;
        if (!detail::parse_digits(text, pos + 1, 2, off_h) || pos + 3 >= text.size() || text[pos + 3] != ':'
            || !detail::parse_digits(text, pos + 4, 2, off_m))
            return invalid();
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
        pos += 6;
    }
    else
    {
        return invalid();
    }

    if (pos != text.size())
        return invalid();

    if (year <= 1)
        return R{std::optional<clock_type::time_point>{}};

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    const std::time_t utc = timegm(&tm_buf) - offset_seconds;

    const auto tp = clock_type::time_point(std::chrono::duration_cast<clock_type::duration>(
        std::chrono::seconds{utc} + std::chrono::nanoseconds{nanos}));
    return R{std::optional<clock_type::time_point>{tp}};
}

[[nodiscard]] inline Json::Value to_json(const token& tok)
{
    Json::Value root(Json::objectValue);
    root["access_token"] = tok.access_token;
    if (!tok.token_type.empty())
        root["token_type"] = tok.token_type;
    if (!tok.refresh_token.empty())
        root["refresh_token"] = tok.refresh_token;
    root["expiry"] = tok.expiry.has_value() ? format_rfc3339(*tok.expiry) : std::string(detail::ZERO_TIME);
    return root;
}

[[nodiscard]] inline std::string to_json_string(const token& tok)
{
    return mailmirror::detail::write_json(to_json(tok));
}

/// Decode a stored token. Unknown members are ignored.
[[nodiscard]] inline result<token> token_from_json(std::string_view text)
{
    Json::Value root;
    MAILMIRROR_TRY(root, mailmirror::detail::parse_json(text));
    if (!root.isObject())
        return fail<token>(errc::codec_invalid_input, "token document is not an object");

    for (const char* key : {"access_token", "token_type", "refresh_token", "expiry"})
    {
        if (root.isMember(key) && !root[key].isString())
        {
            mailmirror::detail::error_detail detail;
            detail.add("field", key);
            return fail<token>(errc::codec_invalid_input, "token field has the wrong type", detail);
        }
    }

    token tok;
    tok.access_token = mailmirror::detail::json_string(root, "access_token");
    tok.token_type = mailmirror::detail::json_string(root, "token_type");
    tok.refresh_token = mailmirror::detail::json_string(root, "refresh_token");

    const std::string expiry = mailmirror::detail::json_string(root, "expiry");
    if (!expiry.empty())
    {
        MAILMIRROR_TRY(tok.expiry, parse_rfc3339(expiry));
    }
    return tok;
}

} // namespace mailmirror::oauth2
