//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_HPP
#define PATHRULES_HPP

#include <pathrules/bindings.hpp>
#include <pathrules/error.hpp>
#include <pathrules/header_rule.hpp>
#include <pathrules/matcher.hpp>
#include <pathrules/pattern.hpp>
#include <pathrules/redirect_rule.hpp>
#include <pathrules/rule_engine.hpp>
#include <pathrules/rule_set.hpp>
#include <pathrules/site_loader.hpp>
#include <pathrules/statuses.hpp>
#include <pathrules/target.hpp>

#endif
