//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_SITE_LOADER_HPP
#define PATHRULES_SITE_LOADER_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/redirect_rule.hpp>
#include <pathrules/rule_set.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace pathrules {

/// The name of the headers file in a site root
constexpr char const* headers_file_name = "_headers";

/// The name of the redirects file in a site root
constexpr char const* redirects_file_name = "_redirects";

/** An error loading a configuration file.

    The error code is either one of @ref error, for
    parse errors, or a system error for I/O failures.
*/
class PATHRULES_SYMBOL_VISIBLE
    config_error
    : public system::system_error
{
    std::string file_;
    std::size_t line_;

public:
    PATHRULES_DECL
    config_error(
        system::error_code const& ec,
        std::string file,
        std::size_t line);

    /// Return the path or name of the file
    std::string const&
    file() const noexcept
    {
        return file_;
    }

    /** Return the 1-based line of the error.

        This is zero when the file could not be read.
    */
    std::size_t
    line() const noexcept
    {
        return line_;
    }
};

/** Build a rule set from the text of the two files.

    @param headers The contents of the headers file.

    @param redirects The contents of the redirects file.

    @param opts Options controlling the parse.

    @throws config_error A file could not be parsed.
    Nothing is built in that case.
*/
PATHRULES_DECL
std::shared_ptr<rule_set const>
build_rules(
    core::string_view headers,
    core::string_view redirects,
    parse_options const& opts = {});

/** Load the rule files of a site.

    Reads `_headers` and `_redirects` from the directory.
    A file which does not exist is treated as empty, but
    one which exists and is not a regular file is an error.

    @param root The site root directory.

    @param opts Options controlling the parse.

    @throws config_error `root` is not a directory, or a
    file could not be read or parsed.
*/
PATHRULES_DECL
std::shared_ptr<rule_set const>
load_rules(
    std::filesystem::path const& root,
    parse_options const& opts = {});

} // pathrules

#endif
