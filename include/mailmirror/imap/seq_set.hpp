/*

seq_set.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

#include <mailmirror/detail/append.hpp>

namespace mailmirror::imap
{

/**
Set of message numbers or UIDs rendered as an IMAP sequence set with
consecutive values collapsed into ranges, e.g. `1:3,7,9:10`.
**/
class seq_set
{
public:
    void add(std::uint32_t value)
    {
        if (value != 0)
            values_.insert(value);
    }

    void add_range(std::uint32_t first, std::uint32_t last)
    {
        for (std::uint64_t v = first; v <= last; ++v)
        {
            if (v != 0)
                values_.insert(static_cast<std::uint32_t>(v));
        }
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return values_.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return values_.size();
    }

    [[nodiscard]] bool contains(std::uint32_t value) const
    {
        return values_.count(value) != 0;
    }

    [[nodiscard]] const std::set<std::uint32_t>& values() const noexcept
    {
        return values_;
    }

    [[nodiscard]] std::string str() const
    {
        std::string out;
        auto it = values_.begin();
        while (it != values_.end())
        {
            const std::uint32_t first = *it;
            std::uint32_t last = first;
            ++it;
            while (it != values_.end() && *it == last + 1)
            {
                last = *it;
                ++it;
            }

            if (!out.empty())
                mailmirror::detail::append_char(out, ',');
            mailmirror::detail::append_uint(out, first);
            if (last != first)
            {
                mailmirror::detail::append_char(out, ':');
                mailmirror::detail::append_uint(out, last);
            }
        }
        return out;
    }

private:
    std::set<std::uint32_t> values_;
};

} // namespace mailmirror::imap
