//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/target.hpp>
#include <boost/assert.hpp>

#include "src/detail/field_chars.hpp"
#include "src/detail/pattern_rule.hpp"

namespace pathrules {

std::string
target_template::
to_string() const
{
    std::string s;
    for(auto const& f : frags_)
    {
        if(! f.is_reference)
        {
            s.append(f.text);
            continue;
        }
        s.push_back('{');
        s.append(f.text);
        s.push_back('}');
    }
    return s;
}

//------------------------------------------------

system::result<target_template>
parse_target(
    core::string_view s,
    pattern const& source)
{
    if(! detail::is_field_value(s))
        PATHRULES_RETURN_EC(
            error::invalid_header_value);

    std::vector<fragment> frags;
    std::string lit;
    auto const end = s.data() + s.size();
    auto it = s.data();
    for(;;)
    {
        auto it1 = grammar::find_if_not(
            it, end, detail::component_char{});
        core::string_view comp(it, it1 - it);
        if(detail::is_brace_form(comp))
        {
            auto const name = comp.substr(
                1, comp.size() - 2);
            if(! detail::is_ident(name))
                PATHRULES_RETURN_EC(
                    error::invalid_capture_name);
            if(! source.binds(name))
                PATHRULES_RETURN_EC(
                    error::unknown_capture_reference);
            if(! lit.empty())
                frags.push_back({ false, std::move(lit) });
            lit.clear();
            frags.push_back({ true, std::string(name) });
        }
        else
        {
            lit.append(comp.data(), comp.size());
        }
        if(it1 == end)
            break;
        // keep the separator
        lit.push_back('/');
        it = it1 + 1;
    }
    if(! lit.empty())
        frags.push_back({ false, std::move(lit) });
    return target_template(std::move(frags));
}

std::string
interpolate(
    target_template const& t,
    bindings const& b)
{
    std::string s;
    for(auto const& f : t)
    {
        if(! f.is_reference)
        {
            s.append(f.text);
            continue;
        }
        auto const v = b.find(f.text);
        BOOST_ASSERT(v != nullptr);
        if(v)
            s.append(*v);
    }
    return s;
}

} // pathrules
