/*

error_detail.hpp
----------------

Structured detail attached to an error_info: one `key=value` entry per line,
so nested causes can be merged under a prefix and read back by tests.

*/

#pragma once

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include <mailmirror/detail/redact.hpp>

namespace mailmirror::detail
{

class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        fmt::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t value)
    {
        fmt::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        return *this;
    }

    /// `key=<value> <message>` for a system error.
    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        fmt::format_to(std::back_inserter(out_), "{}={} {}\n", key, ec.value(), ec.message());
        return *this;
    }

    /// Protocol lines may carry credentials.
    error_detail& add_redacted(std::string_view key, std::string_view line)
    {
        return add(key, redact_line(line));
    }

    /// Copy every non-empty entry of `block` with `prefix` put in front of its key.
    error_detail& merge(std::string_view prefix, std::string_view block)
    {
        std::size_t start = 0;
        while (start < block.size())
        {
            std::size_t eol = block.find('\n', start);
            if (eol == std::string_view::npos)
                eol = block.size();
            if (eol > start)
                fmt::format_to(std::back_inserter(out_), "{}{}\n", prefix, block.substr(start, eol - start));
            start = eol + 1;
        }
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;
};

} // namespace mailmirror::detail
