//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_BINDINGS_HPP
#define PATHRULES_BINDINGS_HPP

#include <pathrules/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pathrules {

/** The captured values produced by one successful match.

    Each entry maps a capture or wildcard name of the
    matched pattern to the text it matched. Wildcard values
    are the remaining path segments joined with `/`.

    Patterns bind only a handful of names, so entries are
    kept in insertion order and searched linearly.
*/
class bindings
{
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator =
        std::vector<value_type>::const_iterator;

    bindings() = default;

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    void
    clear() noexcept
    {
        v_.clear();
    }

    /** Bind `name` to `value`, replacing any previous value.
    */
    void
    set(
        core::string_view name,
        core::string_view value)
    {
        for(auto& e : v_)
        {
            if(core::string_view(e.first) == name)
            {
                e.second.assign(value.data(), value.size());
                return;
            }
        }
        v_.emplace_back(
            std::string(name), std::string(value));
    }

    /** Return a pointer to the value bound to `name`, or null.
    */
    std::string const*
    find(core::string_view name) const noexcept
    {
        for(auto const& e : v_)
            if(core::string_view(e.first) == name)
                return &e.second;
        return nullptr;
    }

    bool
    contains(core::string_view name) const noexcept
    {
        return find(name) != nullptr;
    }

private:
    std::vector<value_type> v_;
};

} // pathrules

#endif
