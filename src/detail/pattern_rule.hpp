//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_SRC_DETAIL_PATTERN_RULE_HPP
#define PATHRULES_SRC_DETAIL_PATTERN_RULE_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/error.hpp>
#include <pathrules/pattern.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <vector>

namespace pathrules {
namespace detail {

/*
pattern           = *( "/" ) [ component *( 1*"/" component ) ] *( "/" )
component         = brace-component / literal-component
brace-component   = "{" [ "*" ] ident "}"
literal-component = 1*( %x00-2E / %x30-FF )   ; anything but slash
ident             = 1*( ALPHA / DIGIT / "_" )
*/

//------------------------------------------------

struct component_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return ch != '/';
    }
};

struct ident_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch == '_');
    }
};

//------------------------------------------------

/** A segment which refers into the parsed string
*/
struct segment_view
{
    segment_kind kind = segment_kind::literal;
    core::string_view text;
};

/** Return true if `s` has the form `{...}`
*/
inline
bool
is_brace_form(
    core::string_view s) noexcept
{
    return
        s.size() >= 2 &&
        s.front() == '{' &&
        s.back() == '}';
}

/** Return true if `s` is a valid capture name
*/
inline
bool
is_ident(
    core::string_view s) noexcept
{
    return
        ! s.empty() &&
        grammar::find_if_not(
            s.data(), s.data() + s.size(),
            ident_char{}) == s.data() + s.size();
}

//------------------------------------------------

constexpr struct
{
    using value_type = segment_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end)
            PATHRULES_RETURN_EC(
                grammar::error::need_more);
        auto const it0 = it;
        it = grammar::find_if_not(
            it, end, component_char{});
        if(it == it0)
            PATHRULES_RETURN_EC(
                grammar::error::mismatch);
        core::string_view s(it0, it - it0);
        value_type v;
        if(! is_brace_form(s))
        {
            v.text = s;
            return v;
        }
        s.remove_prefix(1);
        s.remove_suffix(1);
        v.kind = segment_kind::capture;
        if( ! s.empty() &&
            s.front() == '*')
        {
            v.kind = segment_kind::wildcard;
            s.remove_prefix(1);
        }
        if(! is_ident(s))
        {
            it = it0;
            PATHRULES_RETURN_EC(
                error::invalid_capture_name);
        }
        v.text = s;
        return v;
    }
} component_rule{};

//------------------------------------------------

struct pattern_rule_t
{
    using value_type = std::vector<segment_view>;

    auto
    parse(
        char const*& it,
        char const* const end) const ->
            system::result<value_type>
    {
        value_type rv;
        for(;;)
        {
            while( it != end &&
                    *it == '/')
                ++it;
            if(it == end)
                break;
            if( ! rv.empty() &&
                rv.back().kind == segment_kind::wildcard)
                PATHRULES_RETURN_EC(
                    error::wildcard_not_terminal);
            auto rv1 = grammar::parse(
                it, end, component_rule);
            if(rv1.has_error())
                return rv1.error();
            auto const& sv = rv1.value();
            if(sv.kind != segment_kind::literal)
            {
                for(auto const& prev : rv)
                {
                    if( prev.kind != segment_kind::literal &&
                        prev.text == sv.text)
                        PATHRULES_RETURN_EC(
                            error::duplicate_capture_name);
                }
            }
            rv.push_back(sv);
        }
        // gcc 7 bug workaround
        return system::result<value_type>(std::move(rv));
    }
};

constexpr pattern_rule_t pattern_rule{};

} // detail
} // pathrules

#endif
