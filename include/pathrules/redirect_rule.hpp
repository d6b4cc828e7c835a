//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_REDIRECT_RULE_HPP
#define PATHRULES_REDIRECT_RULE_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/error.hpp>
#include <pathrules/pattern.hpp>
#include <pathrules/target.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace pathrules {

/** Options used when parsing rule files.
*/
struct parse_options
{
    /** Status of redirect lines which do not specify one.

        The redirects file format does not document a
        default, so it is a setting. `302 Found` unless
        changed.
    */
    unsigned default_status = 302;
};

/** A redirect from the paths matching a pattern.
*/
struct redirect_rule
{
    pattern path;
    target_template target;
    unsigned status = 302;
};

/** The outcome of a redirect lookup.

    The server responds with `status` and a `Location`
    header holding `location`, without touching the
    filesystem.
*/
struct redirect
{
    std::string location;
    unsigned status = 302;

    friend
    bool
    operator==(
        redirect const&,
        redirect const&) = default;
};

/** Parse the contents of a redirects file.

    Each non-blank line holds two or three fields
    separated by spaces or tabs: the source pattern,
    the target, and an optional status code.

    @code
    /home              /
    /blog/{year}/{slug} /posts/{year}/{slug} 301
    /old/{*rest}       https://archive.example.com/{rest}
    @endcode

    Lines whose first non-blank character is `#` are
    comments. Status codes are not required to be in the
    redirect range; they are used as written.

    @param text The contents of the file.

    @param opts Options controlling the parse.

    @return The rules in file order, or the first error.
*/
PATHRULES_DECL
system::result<std::vector<redirect_rule>>
parse_redirects(
    core::string_view text,
    parse_options const& opts = {});

/** Parse the contents of a redirects file.

    @param text The contents of the file.

    @param opts Options controlling the parse.

    @param line Set to the 1-based number of the
    line where an error was found, or zero on success.
*/
PATHRULES_DECL
system::result<std::vector<redirect_rule>>
parse_redirects(
    core::string_view text,
    parse_options const& opts,
    std::size_t& line);

} // pathrules

#endif
