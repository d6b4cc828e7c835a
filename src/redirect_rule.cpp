//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/redirect_rule.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/unsigned_rule.hpp>

#include "src/detail/lines.hpp"

namespace pathrules {

namespace {

// at most 3 fields are kept, n counts them all
struct fields
{
    core::string_view v[3];
    std::size_t n = 0;
};

fields
split_fields(core::string_view s) noexcept
{
    fields f;
    auto it = s.data();
    auto const end = it + s.size();
    for(;;)
    {
        it = grammar::find_if_not(
            it, end, detail::ws_char{});
        if(it == end)
            break;
        auto const it1 = grammar::find_if_not(
            it, end, detail::not_ws_char{});
        if(f.n < 3)
            f.v[f.n] = core::string_view(it, it1 - it);
        ++f.n;
        it = it1;
    }
    return f;
}

system::result<unsigned>
parse_status(core::string_view s)
{
    auto rv = grammar::parse(s,
        grammar::unsigned_rule<unsigned short>{});
    if( rv.has_error() ||
        *rv < 1 || *rv > 999)
        PATHRULES_RETURN_EC(
            error::invalid_status_code);
    return static_cast<unsigned>(*rv);
}

} // (anon)

system::result<std::vector<redirect_rule>>
parse_redirects(
    core::string_view text,
    parse_options const& opts)
{
    std::size_t line;
    return parse_redirects(text, opts, line);
}

system::result<std::vector<redirect_rule>>
parse_redirects(
    core::string_view text,
    parse_options const& opts,
    std::size_t& line)
{
    std::vector<redirect_rule> rv;
    detail::line_reader lr(text);
    core::string_view s;
    while(lr.next(s))
    {
        line = lr.line();
        if( detail::is_blank(s) ||
            detail::is_comment(s))
            continue;

        auto const f = split_fields(s);
        if(f.n < 2 || f.n > 3)
            PATHRULES_RETURN_EC(
                error::malformed_redirect_line);

        redirect_rule r;
        {
            auto pat = parse_pattern(f.v[0]);
            if(pat.has_error())
                return pat.error();
            r.path = std::move(*pat);
        }
        {
            auto t = parse_target(f.v[1], r.path);
            if(t.has_error())
                return t.error();
            r.target = std::move(*t);
        }
        if(f.n == 3)
        {
            auto code = parse_status(f.v[2]);
            if(code.has_error())
                return code.error();
            r.status = *code;
        }
        else
        {
            r.status = opts.default_status;
        }
        rv.push_back(std::move(r));
    }
    line = 0;
    return rv;
}

} // pathrules
