//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_PATTERN_HPP
#define PATHRULES_PATTERN_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pathrules {

/** The kind of a pattern segment.
*/
enum class segment_kind : unsigned char
{
    /// Matches one identical path segment
    literal,

    /// Matches any one path segment and binds it
    capture,

    /// Matches the remaining path segments and binds them, joined
    wildcard
};

/** A unit of matching in a path pattern.

    For a literal segment, `text` holds the text which
    must match. For captures and wildcards it holds the
    name the matched text is bound to.
*/
struct segment
{
    segment_kind kind = segment_kind::literal;
    std::string text;

    friend
    bool
    operator==(
        segment const&,
        segment const&) = default;
};

/** The specificity tier of a pattern.

    Tiers compare by specificity: a pattern made only of
    literals is more specific than one containing a capture,
    which is more specific than one containing a wildcard.
*/
enum class specificity : unsigned char
{
    wildcard = 0,
    capture = 1,
    literal = 2
};

//------------------------------------------------

/** A parsed path pattern.

    A pattern is the ordered sequence of segments obtained
    by splitting a path on `/` and dropping empty components.
    Two patterns are equal when their segments are equal,
    regardless of the text they were parsed from.

    @par Invariants
    @li A wildcard segment, if any, is the last segment.
    @li Capture and wildcard names are unique.

    @see parse_pattern
*/
class pattern
{
    std::vector<segment> segs_;

public:
    using const_iterator =
        std::vector<segment>::const_iterator;

    /** Constructor

        Default constructed patterns denote the root path.
    */
    pattern() = default;

    /** Constructor

        The caller is responsible for upholding the
        invariants of the class. Use @ref parse_pattern
        to obtain a validated pattern from text.
    */
    explicit
    pattern(
        std::vector<segment> segs) noexcept
        : segs_(std::move(segs))
    {
    }

    std::vector<segment> const&
    segments() const noexcept
    {
        return segs_;
    }

    const_iterator
    begin() const noexcept
    {
        return segs_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return segs_.end();
    }

    std::size_t
    size() const noexcept
    {
        return segs_.size();
    }

    /// Return true if this is the root pattern
    bool
    empty() const noexcept
    {
        return segs_.empty();
    }

    /** Return the specificity tier of the pattern.

        The tier is that of the least specific segment
        kind present.
    */
    PATHRULES_DECL
    specificity
    tier() const noexcept;

    /// Return true if a capture or wildcard binds `name`
    PATHRULES_DECL
    bool
    binds(core::string_view name) const noexcept;

    /// Return true if the last segment is a wildcard
    bool
    has_wildcard() const noexcept
    {
        return ! segs_.empty() &&
            segs_.back().kind == segment_kind::wildcard;
    }

    /** Return the pattern in canonical text form.

        The root pattern is printed as `/`.
    */
    PATHRULES_DECL
    std::string
    to_string() const;

    friend
    bool
    operator==(
        pattern const&,
        pattern const&) = default;
};

//------------------------------------------------

/** Parse a path pattern.

    Each non-empty component of the `/` separated input
    becomes one segment:

    @li `{name}` is a capture of exactly one path segment,
    @li `{*name}` is a wildcard matching the rest of the path,
    @li anything else is matched literally.

    The empty string, like `/`, denotes the root path.

    @par Example
    @code
    auto rv = parse_pattern( "/docs/{lang}/{*rest}" );
    assert( rv.has_value() );
    assert( rv->tier() == specificity::wildcard );
    @endcode

    @return The pattern, or one of
    @ref error::invalid_capture_name,
    @ref error::wildcard_not_terminal,
    @ref error::duplicate_capture_name.
*/
PATHRULES_DECL
system::result<pattern>
parse_pattern(core::string_view s);

} // pathrules

#endif
