//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_TARGET_HPP
#define PATHRULES_TARGET_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/bindings.hpp>
#include <pathrules/error.hpp>
#include <pathrules/pattern.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace pathrules {

/** A piece of a redirect target.

    When `is_reference` is true, `text` is the name of
    a capture whose bound value is substituted. Otherwise
    `text` is emitted as-is.
*/
struct fragment
{
    bool is_reference = false;
    std::string text;

    friend
    bool
    operator==(
        fragment const&,
        fragment const&) = default;
};

/** A redirect target with capture references.

    The target text is split on `/`, and every component
    of the form `{name}` refers to a value bound by the
    source pattern of the redirect. Literal fragments
    include the separators, so a target without references
    renders back to its original text.

    @see parse_target, interpolate
*/
class target_template
{
    std::vector<fragment> frags_;

public:
    using const_iterator =
        std::vector<fragment>::const_iterator;

    target_template() = default;

    explicit
    target_template(
        std::vector<fragment> frags) noexcept
        : frags_(std::move(frags))
    {
    }

    std::vector<fragment> const&
    fragments() const noexcept
    {
        return frags_;
    }

    const_iterator
    begin() const noexcept
    {
        return frags_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return frags_.end();
    }

    /// Return the target in its textual form
    PATHRULES_DECL
    std::string
    to_string() const;

    friend
    bool
    operator==(
        target_template const&,
        target_template const&) = default;
};

/** Parse a redirect target.

    @param s The target text, for example
    `/blog/{year}/{slug}` or `https://example.com/{rest}`.

    @param source The pattern of the redirect. Every
    reference in the target must name one of its captures.

    @return The template, or one of
    @ref error::invalid_capture_name,
    @ref error::unknown_capture_reference,
    @ref error::invalid_header_value.
*/
PATHRULES_DECL
system::result<target_template>
parse_target(
    core::string_view s,
    pattern const& source);

/** Render a target using the values of a match.

    @par Preconditions
    Every reference in `t` is bound in `b`.
*/
PATHRULES_DECL
std::string
interpolate(
    target_template const& t,
    bindings const& b);

} // pathrules

#endif
