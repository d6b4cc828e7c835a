//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/pattern.hpp>

#include "src/detail/pattern_rule.hpp"

namespace pathrules {

specificity
pattern::
tier() const noexcept
{
    auto t = specificity::literal;
    for(auto const& seg : segs_)
    {
        switch(seg.kind)
        {
        case segment_kind::literal:
            break;
        case segment_kind::capture:
            t = specificity::capture;
            break;
        case segment_kind::wildcard:
            return specificity::wildcard;
        }
    }
    return t;
}

bool
pattern::
binds(core::string_view name) const noexcept
{
    for(auto const& seg : segs_)
        if( seg.kind != segment_kind::literal &&
            core::string_view(seg.text) == name)
            return true;
    return false;
}

std::string
pattern::
to_string() const
{
    if(segs_.empty())
        return "/";
    std::string s;
    for(auto const& seg : segs_)
    {
        s.push_back('/');
        switch(seg.kind)
        {
        case segment_kind::literal:
            s.append(seg.text);
            break;
        case segment_kind::capture:
            s.push_back('{');
            s.append(seg.text);
            s.push_back('}');
            break;
        case segment_kind::wildcard:
            s.append("{*");
            s.append(seg.text);
            s.push_back('}');
            break;
        }
    }
    return s;
}

//------------------------------------------------

system::result<pattern>
parse_pattern(core::string_view s)
{
    auto rv = grammar::parse(
        s, detail::pattern_rule);
    if(rv.has_error())
        return rv.error();
    std::vector<segment> segs;
    segs.reserve(rv->size());
    for(auto const& sv : *rv)
        segs.push_back({ sv.kind, std::string(sv.text) });
    return pattern(std::move(segs));
}

} // pathrules
