//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_STATUSES_HPP
#define PATHRULES_STATUSES_HPP

#include <pathrules/detail/config.hpp>

namespace pathrules {

/** HTTP status code utilities.

    Redirect rules accept any status code. These functions
    let a caller tell whether a code is one a client will
    follow.
*/
namespace statuses {

/** Check if a status code indicates a redirect.

    Returns `true` for status codes that indicate the client
    should redirect to a different URL. This includes:

    @li 300 Multiple Choices
    @li 301 Moved Permanently
    @li 302 Found
    @li 303 See Other
    @li 305 Use Proxy
    @li 307 Temporary Redirect
    @li 308 Permanent Redirect

    Note: 304 Not Modified is not considered a redirect.

    @param code The HTTP status code to check.

    @return `true` if the code indicates a redirect,
    `false` otherwise.
*/
PATHRULES_DECL
bool
is_redirect(unsigned code) noexcept;

/** Check if a status code is a permanent redirect.

    Returns `true` for 301 and 308, whose targets clients
    and caches may remember.
*/
PATHRULES_DECL
bool
is_permanent(unsigned code) noexcept;

} // statuses
} // pathrules

#endif
