//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_TEST_HELPERS_HPP
#define PATHRULES_TEST_HELPERS_HPP

#include <pathrules/header_rule.hpp>
#include <pathrules/pattern.hpp>
#include <pathrules/redirect_rule.hpp>
#include <pathrules/rule_set.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/core/detail/string_view.hpp>
#include <memory>
#include <string>
#include <vector>

namespace pathrules {
namespace test {

// parse a pattern which is known to be valid
inline
pattern
pat(core::string_view s)
{
    auto rv = parse_pattern(s);
    BOOST_TEST(rv.has_value());
    if(! rv)
        return {};
    return *rv;
}

inline
std::vector<header_rule>
headers(core::string_view text)
{
    auto rv = parse_headers(text);
    BOOST_TEST(rv.has_value());
    if(! rv)
        return {};
    return std::move(*rv);
}

inline
std::vector<redirect_rule>
redirects(
    core::string_view text,
    parse_options const& opts = {})
{
    auto rv = parse_redirects(text, opts);
    BOOST_TEST(rv.has_value());
    if(! rv)
        return {};
    return std::move(*rv);
}

inline
std::shared_ptr<rule_set const>
rules(
    core::string_view headers_text,
    core::string_view redirects_text)
{
    return std::make_shared<rule_set>(
        headers(headers_text),
        redirects(redirects_text));
}

} // test
} // pathrules

#endif
