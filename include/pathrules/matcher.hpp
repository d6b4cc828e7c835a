//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_MATCHER_HPP
#define PATHRULES_MATCHER_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/bindings.hpp>
#include <pathrules/pattern.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace pathrules {

/** The winning rule of a lookup and its captured values.
*/
struct match_result
{
    /// Index of the rule, in file order
    std::size_t index = 0;

    /// Values bound by the rule's pattern
    bindings params;
};

/** Split a request path into its non-empty segments.

    The returned views refer into `path`.
*/
PATHRULES_DECL
std::vector<core::string_view>
split_path(core::string_view path);

/** Match a pattern against the segments of a request path.

    @param p The pattern.

    @param path The request path, as returned by @ref split_path.

    @param b Receives the captured values. Entries may be
    added even when the match fails.

    @return `true` if `p` matches the whole path.
*/
PATHRULES_DECL
bool
match_pattern(
    pattern const& p,
    std::vector<core::string_view> const& path,
    bindings& b);

namespace detail {

// Returns the indexes of the patterns ordered
// from most to least specific, stable within a tier.
PATHRULES_DECL
std::vector<std::size_t>
tier_order(
    std::vector<pattern const*> const& v);

// Returns the first entry of `order` whose pattern
// matches `path`, with its bindings.
PATHRULES_DECL
boost::optional<match_result>
match_first(
    std::vector<pattern const*> const& pats,
    std::vector<std::size_t> const& order,
    core::string_view path);

} // detail

//------------------------------------------------

/** A compiled list of rules.

    The matcher owns a list of rules, each with a pattern
    in a member named `path`. A lookup selects among the
    rules whose pattern matches the request path:

    @li a pattern made only of literals wins over one
        with a capture, which wins over one with a wildcard;
    @li among patterns of the same tier, the rule which
        appears first in the list wins.

    Only the selected rule is used; nothing is merged
    from the other matching rules.

    @par Thread Safety
    Distinct objects: Safe.
    Shared objects: Safe for concurrent calls to const members.

    @tparam Rule The rule type.
*/
template<class Rule>
class basic_matcher
{
    std::vector<Rule> rules_;
    std::vector<pattern const*> pats_;
    std::vector<std::size_t> order_;

public:
    using rule_type = Rule;

    basic_matcher() = default;

    /** Constructor

        @param rules The rules, in file order.
    */
    explicit
    basic_matcher(
        std::vector<Rule> rules)
        : rules_(std::move(rules))
    {
        pats_.reserve(rules_.size());
        for(auto const& r : rules_)
            pats_.push_back(&r.path);
        order_ = detail::tier_order(pats_);
    }

    // pats_ points into rules_, whose storage
    // is carried along by a move
    basic_matcher(basic_matcher&&) = default;
    basic_matcher& operator=(basic_matcher&&) = default;
    basic_matcher(basic_matcher const&) = delete;
    basic_matcher& operator=(basic_matcher const&) = delete;

    /// Return the rules in file order
    std::vector<Rule> const&
    rules() const noexcept
    {
        return rules_;
    }

    std::size_t
    size() const noexcept
    {
        return rules_.size();
    }

    bool
    empty() const noexcept
    {
        return rules_.empty();
    }

    /** Return the rule selected for a request path.

        @return The index of the winning rule and its
        bindings, or an empty optional if no rule matches.
    */
    boost::optional<match_result>
    match(core::string_view path) const
    {
        return detail::match_first(
            pats_, order_, path);
    }
};

} // pathrules

#endif
