////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#include <psi/genarena/arena.hpp>

#include <cstdio>
#include <exception>
#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::genarena
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range   () { throw std::out_of_range( "genarena::arena access through an invalid index" ); }
    [[ noreturn, gnu::cold ]] void throw_length_error   () { throw std::length_error( "genarena::arena slot capacity exhausted" ); }
    [[ noreturn, gnu::cold ]] void throw_reserve_overflow() { throw std::length_error( "genarena::arena::reserve() beyond max_size()" ); }

    [[ noreturn, gnu::cold ]] void fatal_exhaustion() noexcept
    {
        std::fputs( "genarena::arena slot capacity exhausted\n", stderr );
        std::terminate();
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::genarena
//------------------------------------------------------------------------------
