//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_RULE_ENGINE_HPP
#define PATHRULES_RULE_ENGINE_HPP

#include <pathrules/detail/config.hpp>
#include <pathrules/rule_set.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <atomic>
#include <memory>
#include <vector>

namespace pathrules {

/** Resolves request paths against the current rule set.

    The engine holds a shared, immutable @ref rule_set.
    Lookups may be performed from any number of threads.
    Each lookup works on the rule set which was current
    when it started; @ref replace installs a new rule set
    for subsequent lookups without disturbing the ones
    in progress.

    @par Example
    @code
    rule_engine eng( load_rules( "/var/www/html" ) );

    // before touching the filesystem
    if( auto r = eng.resolve_redirect( path ) )
        return send_redirect( r->status, r->location );

    // after the response is assembled
    for( auto const& f : eng.resolve_headers( path ) )
        res.set( f.name, f.value );
    @endcode

    @par Thread Safety
    Shared objects: Safe.
*/
class rule_engine
{
    std::atomic<
        std::shared_ptr<rule_set const>> rs_;

public:
    /** Constructor

        The engine starts with an empty rule set.
    */
    PATHRULES_DECL
    rule_engine();

    /** Constructor

        @throws std::invalid_argument `rs` is null.
    */
    PATHRULES_DECL
    explicit
    rule_engine(
        std::shared_ptr<rule_set const> rs);

    rule_engine(rule_engine const&) = delete;
    rule_engine& operator=(rule_engine const&) = delete;

    /** Return the current rule set.
    */
    PATHRULES_DECL
    std::shared_ptr<rule_set const>
    snapshot() const noexcept;

    /** Install a new rule set.

        Lookups which started before the call complete
        against the previous rule set.

        @throws std::invalid_argument `rs` is null.
    */
    PATHRULES_DECL
    void
    replace(
        std::shared_ptr<rule_set const> rs);

    /** Return the headers to add to the response for a path.

        @see rule_set::resolve_headers
    */
    PATHRULES_DECL
    std::vector<header_field>
    resolve_headers(core::string_view path) const;

    /** Return the redirect for a path, if any.

        @see rule_set::resolve_redirect
    */
    PATHRULES_DECL
    boost::optional<redirect>
    resolve_redirect(core::string_view path) const;
};

} // pathrules

#endif
