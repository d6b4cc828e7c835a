//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_HEADER_RULE_HPP
#define PATHRULES_HEADER_RULE_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/error.hpp>
#include <pathrules/pattern.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace pathrules {

/** A response header name and value.
*/
struct header_field
{
    std::string name;
    std::string value;

    friend
    bool
    operator==(
        header_field const&,
        header_field const&) = default;
};

/** A set of headers attached to the paths matching a pattern.

    Fields are kept in file order. When applied to a
    response, a later field replaces an earlier one with
    the same name.
*/
struct header_rule
{
    pattern path;
    std::vector<header_field> headers;
};

/** Parse the contents of a headers file.

    The file consists of groups. Each group starts with an
    unindented line holding a path pattern, followed by
    indented `Name: value` lines:

    @code
    /assets/{*file}
      Cache-Control: public, max-age=31536000
    /docs/{page}
      X-Robots-Tag: noindex
    @endcode

    Blank lines, and lines whose first non-blank character
    is `#`, are ignored. Line endings may be LF or CRLF.

    @param text The contents of the file.

    @return The rules in file order, or the first error.
*/
PATHRULES_DECL
system::result<std::vector<header_rule>>
parse_headers(
    core::string_view text);

/** Parse the contents of a headers file.

    @param text The contents of the file.

    @param line Set to the 1-based number of the
    line where an error was found, or zero on success.
*/
PATHRULES_DECL
system::result<std::vector<header_rule>>
parse_headers(
    core::string_view text,
    std::size_t& line);

} // pathrules

#endif
