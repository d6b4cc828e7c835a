//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_ERROR_HPP
#define PATHRULES_ERROR_HPP

#include <pathrules/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace pathrules {

/** Error codes returned when loading rule files.

    Every error is detected while a configuration is being
    parsed. Resolving a request path never fails.
*/
enum class error
{
    /// A `{name}` or `{*name}` component has an empty or non-identifier name
    invalid_capture_name = 1,

    /// A `{*name}` wildcard is followed by more segments
    wildcard_not_terminal,

    /// The same capture name is bound twice in one pattern
    duplicate_capture_name,

    /// An indented header line appears before any path line
    orphaned_header_line,

    /// An indented header line has no colon
    missing_header_colon,

    /// A header name is not a valid token
    invalid_header_name,

    /// A header value or redirect target contains control characters
    invalid_header_value,

    /// A redirect line does not have 2 or 3 fields
    malformed_redirect_line,

    /// A redirect target references a name the source pattern does not bind
    unknown_capture_reference,

    /// The status field of a redirect line is not a status code
    invalid_status_code
};

//------------------------------------------------

/** Error conditions grouping the error codes by origin.
*/
enum class condition
{
    /** The error came from parsing a path pattern.
    */
    invalid_pattern = 1,

    /** The error is a structural problem in a headers file.
    */
    invalid_headers,

    /** The error is a structural problem in a redirects file.
    */
    invalid_redirects
};

} // pathrules

#include <pathrules/impl/error.hpp>

#endif
