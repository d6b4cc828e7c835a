//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_IMPL_ERROR_HPP
#define PATHRULES_IMPL_ERROR_HPP

#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <boost/system/is_error_condition_enum.hpp>
#include <string>
#include <system_error>
#include <type_traits>

namespace boost {
namespace system {

template<>
struct is_error_code_enum<
    ::pathrules::error>
{
    static bool const value = true;
};

template<>
struct is_error_condition_enum<
    ::pathrules::condition>
{
    static bool const value = true;
};

} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::pathrules::error>
    : std::true_type {};

template<>
struct is_error_condition_enum<
    ::pathrules::condition>
    : std::true_type {};
} // std

namespace pathrules {

namespace detail {

struct PATHRULES_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    PATHRULES_DECL const char* name(
        ) const noexcept override;
    PATHRULES_DECL std::string message(
        int) const override;
    PATHRULES_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x6a1d43c90e2f7b15)
    {
    }
};

struct PATHRULES_SYMBOL_VISIBLE
    condition_cat_type
    : system::error_category
{
    PATHRULES_DECL const char* name(
        ) const noexcept override;
    PATHRULES_DECL std::string message(
        int) const override;
    PATHRULES_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    PATHRULES_DECL bool equivalent(
        system::error_code const&, int
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR condition_cat_type()
        : error_category(0x2c58e7f0b4d3961a)
    {
    }
};

PATHRULES_DECL extern
    error_cat_type error_cat;
PATHRULES_DECL extern
    condition_cat_type condition_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

inline
BOOST_SYSTEM_CONSTEXPR
system::error_condition
make_error_condition(
    condition c) noexcept
{
    return system::error_condition{
        static_cast<std::underlying_type<
            condition>::type>(c),
        detail::condition_cat};
}

} // pathrules

#endif
