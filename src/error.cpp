//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/error.hpp>

namespace pathrules {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "pathrules";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::invalid_capture_name: return "invalid capture name";
    case error::wildcard_not_terminal: return "wildcard not terminal";
    case error::duplicate_capture_name: return "duplicate capture name";
    case error::orphaned_header_line: return "header line before any path";
    case error::missing_header_colon: return "missing colon in header line";
    case error::invalid_header_name: return "invalid header name";
    case error::invalid_header_value: return "invalid header value";
    case error::malformed_redirect_line: return "malformed redirect line";
    case error::unknown_capture_reference: return "unknown capture reference";
    case error::invalid_status_code: return "invalid status code";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "pathrules.condition";
}

std::string
condition_cat_type::
message(int cv) const
{
    return message(cv, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int cv,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(cv))
    {
    default:
    case condition::invalid_pattern: return "invalid pattern";
    case condition::invalid_headers: return "invalid headers file";
    case condition::invalid_redirects: return "invalid redirects file";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int cv) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    switch(static_cast<condition>(cv))
    {
    case condition::invalid_pattern:
        return
            ec == error::invalid_capture_name ||
            ec == error::wildcard_not_terminal ||
            ec == error::duplicate_capture_name;

    case condition::invalid_headers:
        return
            ec == error::orphaned_header_line ||
            ec == error::missing_header_colon ||
            ec == error::invalid_header_name;

    case condition::invalid_redirects:
        return
            ec == error::malformed_redirect_line ||
            ec == error::unknown_capture_reference ||
            ec == error::invalid_status_code;

    default:
        return false;
    }
}

//-----------------------------------------------

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

} // detail
} // pathrules
