////////////////////////////////////////////////////////////////////////////////
/// Generational handles into an arena: the plain (slot, generation) pair and
/// its element-typed and type-erased wrappers. Handles are values: they own
/// nothing and are validated only when used against an arena.
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
#pragma once

#include <boost/container_hash/hash.hpp>

#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <ostream>
#include <typeinfo>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::genarena
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// \class basic_index
////////////////////////////////////////////////////////////////////////////////

template <std::unsigned_integral sz_t, std::unsigned_integral generation_t>
class [[ nodiscard, clang::trivial_abi ]] basic_index
{
public:
    using size_type       = sz_t;
    using generation_type = generation_t;

    constexpr basic_index() noexcept = default;

    // No validation: the result is checked only on next use against an arena.
    [[ gnu::const ]] static constexpr basic_index from_raw_parts( size_type const slot, generation_type const generation ) noexcept
    {
        return { slot, generation };
    }
    [[ gnu::pure ]] constexpr std::pair<size_type, generation_type> into_raw_parts() const noexcept { return { slot_, generation_ }; }

    [[ gnu::pure ]] constexpr size_type       slot      () const noexcept { return slot_;       }
    [[ gnu::pure ]] constexpr generation_type generation() const noexcept { return generation_; }

    // ordered by slot position first
    constexpr auto operator<=>( basic_index const & ) const noexcept = default;
    constexpr bool operator== ( basic_index const & ) const noexcept = default;

private:
    constexpr basic_index( size_type const slot, generation_type const generation ) noexcept
        : slot_{ slot }, generation_{ generation } {}

    size_type       slot_      {};
    generation_type generation_{};
}; // class basic_index

using index = basic_index<std::uint32_t, std::uint32_t>;

template <typename Char, typename Traits, typename sz_t, typename generation_t>
std::basic_ostream<Char, Traits> & operator<<( std::basic_ostream<Char, Traits> & os, basic_index<sz_t, generation_t> const idx )
{
    // promote so that 8 bit types do not print as characters
    return os << "{ slot: " << +idx.slot() << ", generation: " << +idx.generation() << " }";
}


////////////////////////////////////////////////////////////////////////////////
// \class typed_index
//
// An index tagged with the element type of the arena that issued it. Mixing
// up handles of arenas with different element types becomes a compile error.
////////////////////////////////////////////////////////////////////////////////

template <typename T, typename Index = index>
class [[ nodiscard, clang::trivial_abi ]] typed_index
{
public:
    using element_type    = T;
    using untyped_type    = Index;
    using size_type       = typename Index::size_type;
    using generation_type = typename Index::generation_type;

    constexpr typed_index() noexcept = default;
    constexpr explicit typed_index( Index const inner ) noexcept : inner_{ inner } {}

    [[ gnu::const ]] static constexpr typed_index from_raw_parts( size_type const slot, generation_type const generation ) noexcept
    {
        return typed_index{ Index::from_raw_parts( slot, generation ) };
    }
    [[ gnu::pure ]] constexpr auto into_raw_parts() const noexcept { return inner_.into_raw_parts(); }

    [[ gnu::pure ]] constexpr Index           untyped   () const noexcept { return inner_;              }
    [[ gnu::pure ]] constexpr size_type       slot      () const noexcept { return inner_.slot();       }
    [[ gnu::pure ]] constexpr generation_type generation() const noexcept { return inner_.generation(); }

    constexpr auto operator<=>( typed_index const & ) const noexcept = default;
    constexpr bool operator== ( typed_index const & ) const noexcept = default;

private:
    Index inner_;
}; // class typed_index

template <typename Char, typename Traits, typename T, typename Index>
std::basic_ostream<Char, Traits> & operator<<( std::basic_ostream<Char, Traits> & os, typed_index<T, Index> const idx )
{
    return os << idx.untyped();
}


////////////////////////////////////////////////////////////////////////////////
// \class dyn_index
//
// Type-erased handle: remembers the element type it was created for so that
// it can be stored alongside handles into arenas of other types and checked
// when converted back or used.
////////////////////////////////////////////////////////////////////////////////

template <typename Index = index>
class [[ nodiscard ]] dyn_index
{
public:
    using untyped_type = Index;

    template <typename T>
    constexpr dyn_index( typed_index<T, Index> const idx ) noexcept
        : inner_{ idx.untyped() }, type_{ &typeid( T ) } {}

    template <typename T>
    [[ gnu::pure ]] bool holds() const noexcept { return *type_ == typeid( T ); }

    //! <b>Throws</b>: std::bad_cast if the handle was not created for T.
    template <typename T>
    typed_index<T, Index> as() const
    {
        if ( !holds<T>() ) [[ unlikely ]]
            throw std::bad_cast{};
        return typed_index<T, Index>{ inner_ };
    }

    [[ gnu::pure ]] Index                  untyped() const noexcept { return inner_;        }
    [[ gnu::pure ]] std::type_info const & type   () const noexcept { return *type_;        }
    [[ gnu::pure ]] char           const * name   () const noexcept { return type_->name(); }

    friend bool operator==( dyn_index const & left, dyn_index const & right ) noexcept
    {
        return ( left.inner_ == right.inner_ ) && ( *left.type_ == *right.type_ );
    }

private:
    Index                  inner_;
    std::type_info const * type_;
}; // class dyn_index

//------------------------------------------------------------------------------
} // namespace psi::genarena
//------------------------------------------------------------------------------

template <typename sz_t, typename generation_t>
struct std::hash<psi::genarena::basic_index<sz_t, generation_t>>
{
    std::size_t operator()( psi::genarena::basic_index<sz_t, generation_t> const idx ) const noexcept
    {
        std::size_t seed{ 0 };
        boost::hash_combine( seed, idx.slot()       );
        boost::hash_combine( seed, idx.generation() );
        return seed;
    }
};

template <typename T, typename Index>
struct std::hash<psi::genarena::typed_index<T, Index>>
{
    std::size_t operator()( psi::genarena::typed_index<T, Index> const idx ) const noexcept { return std::hash<Index>{}( idx.untyped() ); }
};

template <typename Index>
struct std::hash<psi::genarena::dyn_index<Index>>
{
    std::size_t operator()( psi::genarena::dyn_index<Index> const & idx ) const noexcept
    {
        auto seed{ std::hash<Index>{}( idx.untyped() ) };
        boost::hash_combine( seed, idx.type().hash_code() );
        return seed;
    }
};
//------------------------------------------------------------------------------
