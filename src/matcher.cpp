//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/matcher.hpp>
#include <boost/assert.hpp>
#include <algorithm>
#include <numeric>

namespace pathrules {

std::vector<core::string_view>
split_path(core::string_view path)
{
    std::vector<core::string_view> v;
    auto it = path.data();
    auto const end = it + path.size();
    while(it != end)
    {
        if(*it == '/')
        {
            ++it;
            continue;
        }
        auto it1 = std::find(it, end, '/');
        v.emplace_back(it, it1 - it);
        it = it1;
    }
    return v;
}

bool
match_pattern(
    pattern const& p,
    std::vector<core::string_view> const& path,
    bindings& b)
{
    auto it = path.begin();
    auto const end = path.end();
    for(auto const& seg : p)
    {
        switch(seg.kind)
        {
        case segment_kind::literal:
            if( it == end ||
                *it != core::string_view(seg.text))
                return false;
            ++it;
            break;

        case segment_kind::capture:
            if(it == end)
                return false;
            b.set(seg.text, *it);
            ++it;
            break;

        case segment_kind::wildcard:
        {
            // zero or more segments, joined
            std::string s;
            for(; it != end; ++it)
            {
                if(! s.empty())
                    s.push_back('/');
                s.append(it->data(), it->size());
            }
            b.set(seg.text, s);
            break;
        }
        }
    }
    // require full match
    return it == end;
}

namespace detail {

std::vector<std::size_t>
tier_order(
    std::vector<pattern const*> const& v)
{
    std::vector<std::size_t> order(v.size());
    std::iota(order.begin(), order.end(), std::size_t(0));
    std::stable_sort(order.begin(), order.end(),
        [&v](std::size_t a, std::size_t b)
        {
            return v[a]->tier() > v[b]->tier();
        });
    return order;
}

boost::optional<match_result>
match_first(
    std::vector<pattern const*> const& pats,
    std::vector<std::size_t> const& order,
    core::string_view path)
{
    BOOST_ASSERT(pats.size() == order.size());
    auto const segs = split_path(path);
    match_result mr;
    for(auto i : order)
    {
        mr.params.clear();
        if(! match_pattern(*pats[i], segs, mr.params))
            continue;
        mr.index = i;
        return mr;
    }
    return boost::none;
}

} // detail
} // pathrules
