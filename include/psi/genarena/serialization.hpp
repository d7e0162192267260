////////////////////////////////////////////////////////////////////////////////
/// Boost.Serialization support for arenas and their indices.
///
/// An arena is stored as its slot count and element version followed by one
/// record per slot: an occupancy flag and, for occupied slots, the generation
/// and the element.
/// Loading preserves every occupied slot's position and generation (so that
/// indices saved alongside the arena remain valid), vacant slots restart at
/// the highest generation found in the archive. Elements are relocated when
/// the arena is rebuilt (as on any arena growth) so pointers to them do not
/// survive a round trip: store indices instead.
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

#include <psi/genarena/arena.hpp>
#include <psi/genarena/typed_arena.hpp>

#include <boost/archive/archive_exception.hpp>
#include <boost/serialization/detail/stack_constructor.hpp>
#include <boost/serialization/item_version_type.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/split_free.hpp>
#include <boost/serialization/version.hpp>

#include <deque>
#include <optional>
#include <utility>
//------------------------------------------------------------------------------
namespace boost::serialization
{
//------------------------------------------------------------------------------

template <class Archive, typename sz_t, typename generation_t>
void save( Archive & ar, psi::genarena::basic_index<sz_t, generation_t> const & idx, unsigned int /*version*/ )
{
    auto const slot      { idx.slot()       };
    auto const generation{ idx.generation() };
    ar << make_nvp( "slot"      , slot       );
    ar << make_nvp( "generation", generation );
}

template <class Archive, typename sz_t, typename generation_t>
void load( Archive & ar, psi::genarena::basic_index<sz_t, generation_t> & idx, unsigned int /*version*/ )
{
    sz_t         slot;
    generation_t generation;
    ar >> make_nvp( "slot"      , slot       );
    ar >> make_nvp( "generation", generation );
    idx = psi::genarena::basic_index<sz_t, generation_t>::from_raw_parts( slot, generation );
}

template <class Archive, typename sz_t, typename generation_t>
void serialize( Archive & ar, psi::genarena::basic_index<sz_t, generation_t> & idx, unsigned int const version )
{
    split_free( ar, idx, version );
}

template <class Archive, typename T, typename Index>
void save( Archive & ar, psi::genarena::typed_index<T, Index> const & idx, unsigned int /*version*/ )
{
    auto const untyped{ idx.untyped() };
    ar << make_nvp( "index", untyped );
}

template <class Archive, typename T, typename Index>
void load( Archive & ar, psi::genarena::typed_index<T, Index> & idx, unsigned int /*version*/ )
{
    Index untyped;
    ar >> make_nvp( "index", untyped );
    idx = psi::genarena::typed_index<T, Index>{ untyped };
}

template <class Archive, typename T, typename Index>
void serialize( Archive & ar, psi::genarena::typed_index<T, Index> & idx, unsigned int const version )
{
    split_free( ar, idx, version );
}


template <class Archive, typename T, typename sz_t, typename generation_t, auto exhaustion_handler>
void save( Archive & ar, psi::genarena::arena<T, sz_t, generation_t, exhaustion_handler> const & source, unsigned int /*version*/ )
{
    auto const slot_count{ source.slot_count() };
    auto const stored_count{ static_cast<unsigned long long>( slot_count ) };
    item_version_type const item_version{ version<T>::value };
    ar << make_nvp( "slot_count"  , stored_count );
    ar << make_nvp( "item_version", item_version );
    for ( sz_t position{ 0 }; position != slot_count; ++position )
    {
        auto const element { source.get_unknown_gen( position ) };
        bool const occupied{ element.has_value() };
        ar << make_nvp( "occupied", occupied );
        if ( occupied )
        {
            auto const generation{ element->first.generation() };
            ar << make_nvp( "generation", generation      );
            ar << make_nvp( "value"     , element->second );
        }
    }
}

//! <b>Throws</b>: boost::archive::archive_exception if the archive holds more
//!   slots than the target arena type can address or ends before the last
//!   slot record. The target is left unchanged on failure.
template <class Archive, typename T, typename sz_t, typename generation_t, auto exhaustion_handler>
void load( Archive & ar, psi::genarena::arena<T, sz_t, generation_t, exhaustion_handler> & target, unsigned int /*version*/ )
{
    using arena_t = psi::genarena::arena<T, sz_t, generation_t, exhaustion_handler>;

    // read as the widest type so that an oversized count is detected rather than truncated
    unsigned long long slot_count;
    item_version_type  item_version;
    ar >> make_nvp( "slot_count"  , slot_count   );
    ar >> make_nvp( "item_version", item_version );
    if ( slot_count > arena_t::max_size() ) [[ unlikely ]]
        throw archive::archive_exception( archive::archive_exception::other_exception, psi::genarena::arena_error{ psi::genarena::arena_error::malformed_snapshot }.message() );

    // the count is not trusted for preallocation: storage grows only with
    // records actually read (a deque also keeps loaded elements in place)
    std::deque<typename arena_t::snapshot_entry> entries;
    for ( unsigned long long position{ 0 }; position != slot_count; ++position )
    {
        bool occupied;
        ar >> make_nvp( "occupied", occupied );
        if ( !occupied )
        {
            entries.emplace_back( std::nullopt );
            continue;
        }
        generation_t generation;
        ar >> make_nvp( "generation", generation );
        detail::stack_construct<Archive, T> value( ar, item_version );
        ar >> make_nvp( "value", value.reference() );
        auto & entry{ entries.emplace_back( std::in_place, generation, std::move( value.reference() ) ) };
        ar.reset_object_address( &entry->second, value.address() );
    }

    auto restored{ arena_t::from_snapshot( std::move( entries ) ).as_result_or_error() };
    if ( !restored ) [[ unlikely ]]
        throw archive::archive_exception( archive::archive_exception::other_exception, restored.error().message() );
    target = *std::move( restored );
}

template <class Archive, typename T, typename sz_t, typename generation_t, auto exhaustion_handler>
void serialize( Archive & ar, psi::genarena::arena<T, sz_t, generation_t, exhaustion_handler> & subject, unsigned int const version )
{
    split_free( ar, subject, version );
}

template <class Archive, typename T, typename sz_t, typename generation_t, auto exhaustion_handler>
void serialize( Archive & ar, psi::genarena::typed_arena<T, sz_t, generation_t, exhaustion_handler> & subject, unsigned int /*version*/ )
{
    ar & make_nvp( "arena", subject.untyped() );
}

//------------------------------------------------------------------------------
} // namespace boost::serialization
//------------------------------------------------------------------------------
