//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_SRC_DETAIL_LINES_HPP
#define PATHRULES_SRC_DETAIL_LINES_HPP

#include <pathrules/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/charset.hpp>
#include <cstddef>

namespace pathrules {
namespace detail {

struct ws_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return ch == ' ' || ch == '\t';
    }
};

struct not_ws_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return ch != ' ' && ch != '\t';
    }
};

// remove leading and trailing spaces and tabs
inline
core::string_view
trim(core::string_view s) noexcept
{
    auto it = grammar::find_if_not(
        s.data(), s.data() + s.size(), ws_char{});
    auto end = s.data() + s.size();
    while(end != it && ws_char{}(end[-1]))
        --end;
    return core::string_view(it, end - it);
}

inline
bool
is_blank(core::string_view s) noexcept
{
    return trim(s).empty();
}

// true if the first non-blank character is '#'
inline
bool
is_comment(core::string_view s) noexcept
{
    auto const t = trim(s);
    return ! t.empty() && t.front() == '#';
}

inline
bool
is_indented(core::string_view s) noexcept
{
    return ! s.empty() && ws_char{}(s.front());
}

//------------------------------------------------

// Iterates the lines of a text, without
// the line terminator. Handles LF and CRLF.
class line_reader
{
    core::string_view rest_;
    std::size_t n_ = 0;
    bool done_ = false;

public:
    explicit
    line_reader(
        core::string_view text) noexcept
        : rest_(text)
        , done_(text.empty())
    {
    }

    // 1-based number of the last line returned
    std::size_t
    line() const noexcept
    {
        return n_;
    }

    bool
    next(core::string_view& line) noexcept
    {
        if(done_)
            return false;
        auto const pos = rest_.find('\n');
        if(pos == core::string_view::npos)
        {
            line = rest_;
            rest_ = {};
            done_ = true;
        }
        else
        {
            line = rest_.substr(0, pos);
            rest_.remove_prefix(pos + 1);
            done_ = rest_.empty();
        }
        if( ! line.empty() &&
            line.back() == '\r')
            line.remove_suffix(1);
        ++n_;
        return true;
    }
};

} // detail
} // pathrules

#endif
