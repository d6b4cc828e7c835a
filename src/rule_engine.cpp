//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/rule_engine.hpp>
#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace pathrules {

rule_engine::
rule_engine()
    : rs_(std::make_shared<rule_set>())
{
}

rule_engine::
rule_engine(
    std::shared_ptr<rule_set const> rs)
{
    if(! rs)
        boost::throw_exception(std::invalid_argument(
            "null rule set"), BOOST_CURRENT_LOCATION);
    rs_.store(std::move(rs));
}

std::shared_ptr<rule_set const>
rule_engine::
snapshot() const noexcept
{
    return rs_.load(std::memory_order_acquire);
}

void
rule_engine::
replace(
    std::shared_ptr<rule_set const> rs)
{
    if(! rs)
        boost::throw_exception(std::invalid_argument(
            "null rule set"), BOOST_CURRENT_LOCATION);
    BOOST_LOG_TRIVIAL(debug) <<
        "replacing rules: " <<
        rs->headers().size() << " header rules, " <<
        rs->redirects().size() << " redirects";
    rs_.store(std::move(rs), std::memory_order_release);
}

std::vector<header_field>
rule_engine::
resolve_headers(core::string_view path) const
{
    return snapshot()->resolve_headers(path);
}

boost::optional<redirect>
rule_engine::
resolve_redirect(core::string_view path) const
{
    return snapshot()->resolve_redirect(path);
}

} // pathrules
