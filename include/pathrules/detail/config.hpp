//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHRULES_DETAIL_CONFIG_HPP
#define PATHRULES_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

//------------------------------------------------

# if (defined(PATHRULES_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(PATHRULES_STATIC_LINK)
#  if defined(PATHRULES_SOURCE)
#   define PATHRULES_DECL        BOOST_SYMBOL_EXPORT
#   define PATHRULES_BUILD_DLL
#  else
#   define PATHRULES_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  PATHRULES_DECL
#  define PATHRULES_DECL
# endif

#if defined(__MINGW32__)
    #define PATHRULES_SYMBOL_VISIBLE PATHRULES_DECL
#else
    #define PATHRULES_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef PATHRULES_NO_SOURCE_LOCATION
# define PATHRULES_RETURN_EC(ev) return (ev)
#else
# define PATHRULES_RETURN_EC(ev)                                  \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

// lift the boost namespaces we use into ours
namespace boost {
namespace core {}
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace pathrules {
namespace core = ::boost::core;
namespace system = ::boost::system;
namespace grammar = ::boost::urls::grammar;
} // pathrules

#endif
