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
#include <psi/genarena/error.hpp>
//------------------------------------------------------------------------------
namespace psi::genarena
{
//------------------------------------------------------------------------------

char const * arena_error::message() const noexcept
{
    switch ( value )
    {
        case capacity_exhausted: return "arena slot capacity exhausted";
        case aliased_slots     : return "both indices refer to the same slot";
        case malformed_snapshot: return "malformed arena snapshot";
    }
    return "unknown arena error";
}

arena_exception make_exception( arena_error const error ) { return arena_exception{ error }; }

//------------------------------------------------------------------------------
} // namespace psi::genarena
//------------------------------------------------------------------------------
