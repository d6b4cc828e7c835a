//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/rule_set.hpp>
#include <pathrules/target.hpp>

namespace pathrules {

rule_set::
rule_set(
    std::vector<header_rule> headers,
    std::vector<redirect_rule> redirects)
    : headers_(std::move(headers))
    , redirects_(std::move(redirects))
{
}

boost::optional<match_result>
rule_set::
match_headers(core::string_view path) const
{
    return headers_.match(path);
}

boost::optional<match_result>
rule_set::
match_redirect(core::string_view path) const
{
    return redirects_.match(path);
}

std::vector<header_field>
rule_set::
resolve_headers(core::string_view path) const
{
    auto mr = headers_.match(path);
    if(! mr)
        return {};
    return headers_.rules()[mr->index].headers;
}

boost::optional<redirect>
rule_set::
resolve_redirect(core::string_view path) const
{
    auto mr = redirects_.match(path);
    if(! mr)
        return boost::none;
    auto const& r = redirects_.rules()[mr->index];
    return redirect{
        interpolate(r.target, mr->params),
        r.status };
}

} // pathrules
