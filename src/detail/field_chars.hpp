//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_SRC_DETAIL_FIELD_CHARS_HPP
#define PATHRULES_SRC_DETAIL_FIELD_CHARS_HPP

#include <pathrules/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/charset.hpp>

namespace pathrules {
namespace detail {

/*
token          = 1*tchar
tchar          = "!" / "#" / "$" / "%" / "&" / "'" / "*"
               / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
               / DIGIT / ALPHA
field-value    = *( HTAB / SP / VCHAR / obs-text )
*/

struct tchar
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        switch(ch)
        {
        case '!': case '#': case '$': case '%':
        case '&': case '\'': case '*': case '+':
        case '-': case '.': case '^': case '_':
        case '`': case '|': case '~':
            return true;
        default:
            return
                (ch >= 'a' && ch <= 'z') ||
                (ch >= '0' && ch <= '9') ||
                (ch >= 'A' && ch <= 'Z');
        }
    }
};

struct field_value_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        auto const c = static_cast<unsigned char>(ch);
        return c == '\t' || (c >= 0x20 && c != 0x7f);
    }
};

inline
bool
is_token(core::string_view s) noexcept
{
    return
        ! s.empty() &&
        grammar::find_if_not(
            s.data(), s.data() + s.size(),
            tchar{}) == s.data() + s.size();
}

inline
bool
is_field_value(core::string_view s) noexcept
{
    return grammar::find_if_not(
        s.data(), s.data() + s.size(),
        field_value_char{}) == s.data() + s.size();
}

} // detail
} // pathrules

#endif
