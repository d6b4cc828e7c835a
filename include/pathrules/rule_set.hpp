//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_RULE_SET_HPP
#define PATHRULES_RULE_SET_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/header_rule.hpp>
#include <pathrules/matcher.hpp>
#include <pathrules/redirect_rule.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <vector>

namespace pathrules {

using header_matcher = basic_matcher<header_rule>;
using redirect_matcher = basic_matcher<redirect_rule>;

/** The compiled rules of one configuration load.

    A rule set is built once from the parsed contents of
    a headers file and a redirects file and is not modified
    afterwards. It is usually shared through a
    `std::shared_ptr<rule_set const>`, see @ref rule_engine.

    @par Thread Safety
    Distinct objects: Safe.
    Shared objects: Safe.
*/
class rule_set
{
    header_matcher headers_;
    redirect_matcher redirects_;

public:
    /** Constructor

        Default constructed rule sets match nothing.
    */
    rule_set() = default;

    /** Constructor

        @param headers The header rules, in file order.

        @param redirects The redirect rules, in file order.
    */
    PATHRULES_DECL
    rule_set(
        std::vector<header_rule> headers,
        std::vector<redirect_rule> redirects);

    header_matcher const&
    headers() const noexcept
    {
        return headers_;
    }

    redirect_matcher const&
    redirects() const noexcept
    {
        return redirects_;
    }

    /// Return true if there are no rules
    bool
    empty() const noexcept
    {
        return headers_.empty() && redirects_.empty();
    }

    /** Return the header rule selected for a path.
    */
    PATHRULES_DECL
    boost::optional<match_result>
    match_headers(core::string_view path) const;

    /** Return the redirect rule selected for a path.
    */
    PATHRULES_DECL
    boost::optional<match_result>
    match_redirect(core::string_view path) const;

    /** Return the headers to add to the response for a path.

        @return The fields of the selected rule in file order,
        or an empty vector if no rule matches.
    */
    PATHRULES_DECL
    std::vector<header_field>
    resolve_headers(core::string_view path) const;

    /** Return the redirect for a path, if any.

        The location is the rule's target with every
        reference replaced by its captured value.
    */
    PATHRULES_DECL
    boost::optional<redirect>
    resolve_redirect(core::string_view path) const;
};

} // pathrules

#endif
