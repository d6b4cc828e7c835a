//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/statuses.hpp>

namespace pathrules {
namespace statuses {

bool
is_redirect( unsigned code ) noexcept
{
    switch( code )
    {
    case 300: // Multiple Choices
    case 301: // Moved Permanently
    case 302: // Found
    case 303: // See Other
    case 305: // Use Proxy
    case 307: // Temporary Redirect
    case 308: // Permanent Redirect
        return true;
    default:
        return false;
    }
}

bool
is_permanent( unsigned code ) noexcept
{
    return code == 301 || code == 308;
}

} // statuses
} // pathrules
