////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
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
#pragma once

#include <psi/err/fallible_result.hpp>

#include <cstdint>
#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::genarena
{
//------------------------------------------------------------------------------

struct [[ clang::trivial_abi ]] arena_error
{
    enum value_type : std::uint8_t
    {
        capacity_exhausted = 1, // no free slot and the slot count is at max_size()
        aliased_slots,          // get_pair() given two indices into the same slot
        malformed_snapshot      // from_snapshot()/deserialization rejected the input
    };

    constexpr arena_error() noexcept = default;
    constexpr arena_error( value_type const code ) noexcept : value{ code } {}

    [[ gnu::pure ]] constexpr value_type get() const noexcept { return value; }

    [[ gnu::pure ]] char const * message() const noexcept;

    friend constexpr bool operator==( arena_error, arena_error ) noexcept = default;

    value_type value{ capacity_exhausted };
}; // struct arena_error

class arena_exception : public std::runtime_error
{
public:
    explicit arena_exception( arena_error const error ) : std::runtime_error{ error.message() }, error_{ error } {}

    arena_error error() const noexcept { return error_; }

private:
    arena_error error_;
}; // class arena_exception

[[ gnu::cold ]] arena_exception make_exception( arena_error );

template <typename Result>
using fallible_result = err::fallible_result<Result, arena_error>;

template <typename Result>
using result_or_error = err::result_or_error<Result, arena_error>;

//------------------------------------------------------------------------------
} // namespace psi::genarena
//------------------------------------------------------------------------------
