//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/header_rule.hpp>

#include "src/detail/field_chars.hpp"
#include "src/detail/lines.hpp"

namespace pathrules {

system::result<std::vector<header_rule>>
parse_headers(
    core::string_view text)
{
    std::size_t line;
    return parse_headers(text, line);
}

system::result<std::vector<header_rule>>
parse_headers(
    core::string_view text,
    std::size_t& line)
{
    std::vector<header_rule> rv;
    detail::line_reader lr(text);
    core::string_view s;
    while(lr.next(s))
    {
        line = lr.line();
        if( detail::is_blank(s) ||
            detail::is_comment(s))
            continue;

        if(! detail::is_indented(s))
        {
            auto pat = parse_pattern(detail::trim(s));
            if(pat.has_error())
                return pat.error();
            rv.push_back({ std::move(*pat), {} });
            continue;
        }

        if(rv.empty())
            PATHRULES_RETURN_EC(
                error::orphaned_header_line);

        auto const kv = detail::trim(s);
        auto const colon = kv.find(':');
        if(colon == core::string_view::npos)
            PATHRULES_RETURN_EC(
                error::missing_header_colon);
        auto const name = detail::trim(kv.substr(0, colon));
        auto const value = detail::trim(kv.substr(colon + 1));
        if(! detail::is_token(name))
            PATHRULES_RETURN_EC(
                error::invalid_header_name);
        if(! detail::is_field_value(value))
            PATHRULES_RETURN_EC(
                error::invalid_header_value);
        rv.back().headers.push_back({
            std::string(name),
            std::string(value) });
    }
    line = 0;
    return rv;
}

} // pathrules
