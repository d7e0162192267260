////////////////////////////////////////////////////////////////////////////////
/// Generational arena: a contiguous, growable pool of T handing out
/// (slot, generation) indices instead of pointers. Vacant slots are threaded
/// into an intrusive free list (most recently freed first) and every removal
/// advances the slot's generation so that stale indices can never resolve to
/// a later occupant of the same slot (no ABA). Generations saturate: a slot
/// whose generation reached the maximum is retired rather than wrapped.
///
/// Two insertion families are provided:
///  * try_* (fallible) - report capacity exhaustion as an arena_error
///  * unchecked        - invoke the exhaustion_handler template argument
///                       (throw_on_exhaustion or terminate_on_exhaustion).
///
/// Not internally synchronized: mutation requires exclusive access.
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

#include <psi/genarena/error.hpp>
#include <psi/genarena/index.hpp>

#include <boost/assert.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::genarena
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range();
    [[ noreturn, gnu::cold ]] void throw_length_error();
    [[ noreturn, gnu::cold ]] void throw_reserve_overflow();
    [[ noreturn, gnu::cold ]] void fatal_exhaustion() noexcept;
} // namespace detail

struct throw_on_exhaustion { // std::length_error, as std::vector past max_size()
    [[ noreturn ]] void operator()() const { detail::throw_length_error(); }
}; // throw_on_exhaustion
struct terminate_on_exhaustion {
    [[ noreturn ]] void operator()() const noexcept { detail::fatal_exhaustion(); }
}; // terminate_on_exhaustion

// Handle types accepted by arena<T> accessors.
template <typename I, typename T, typename Index>
concept handle_for =
    std::same_as<I, Index                > ||
    std::same_as<I, typed_index<T, Index>> ||
    std::same_as<I, dyn_index<Index>     >;


////////////////////////////////////////////////////////////////////////////////
// \class arena
////////////////////////////////////////////////////////////////////////////////

template
<
    typename T,
    std::unsigned_integral sz_t         = std::uint32_t,
    std::unsigned_integral generation_t = std::uint32_t,
    auto                   exhaustion_handler = throw_on_exhaustion{}
>
class arena
{
public:
    using value_type       = T;
    using size_type        = sz_t;
    using generation_type  = generation_t;
    using index_type       = basic_index<size_type, generation_type>;
    using typed_index_type = typed_index<value_type, index_type>;
    using dyn_index_type   = dyn_index<index_type>;

    using       element_reference = std::pair<index_type, value_type       &>;
    using const_element_reference = std::pair<index_type, value_type const &>;

    // one entry per slot: generation and value of an occupied slot, nullopt for a vacant one
    using snapshot_entry = std::optional<std::pair<generation_type, value_type>>;

    class drain_range;

private:
    enum class slot_state : std::uint8_t { vacant, occupied, retired };

    // free list terminator (never a valid slot position)
    static size_type constexpr null_slot{ std::numeric_limits<size_type>::max() };

    struct slot
    {
        constexpr slot( generation_type const gen, size_type const next ) noexcept
            : generation{ gen }, next_free{ next }, state{ slot_state::vacant } {}

        template <typename ...Args>
        constexpr slot( std::in_place_t, generation_type const gen, Args &&...args ) noexcept( std::is_nothrow_constructible_v<value_type, Args...> )
            : generation{ gen }, next_free{ null_slot }, state{ slot_state::occupied }
        {
            std::construct_at( &value, std::forward<Args>( args )... );
        }

        slot( slot const & other ) noexcept( std::is_nothrow_copy_constructible_v<value_type> )
            : generation{ other.generation }, next_free{ other.next_free }, state{ other.state }
        {
            if ( occupied() )
                std::construct_at( &value, other.value );
        }
        slot( slot && other ) noexcept( std::is_nothrow_move_constructible_v<value_type> )
            : generation{ other.generation }, next_free{ other.next_free }, state{ other.state }
        {
            if ( occupied() )
                std::construct_at( &value, std::move( other.value ) );
        }
        // the backing vector is only ever appended to, copied or moved as a whole
        slot & operator=( slot const &  ) = delete;
        slot & operator=( slot       && ) = delete;

        ~slot() noexcept
        {
            if ( occupied() )
                std::destroy_at( &value );
        }

        [[ gnu::pure ]] bool occupied() const noexcept { return state == slot_state::occupied; }
        [[ gnu::pure ]] bool vacant  () const noexcept { return state == slot_state::vacant  ; }

        generation_type generation; // occupied: current, vacant: that of the next occupant
        size_type       next_free;  // vacant only
        slot_state      state;
        union { value_type value; };
    }; // struct slot

    using storage = std::vector<slot>;

    template <typename Impl, typename Reference>
    using iter_impl = boost::stl_interfaces::proxy_iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        Impl,
#   endif
        std::bidirectional_iterator_tag,
        Reference
    >;

    ////////////////////////////////////////////////////////////////////////////
    // \class basic_iterator
    // Bidirectional traversal of the occupied slots in position order yielding
    // (index, element reference) proxies.
    ////////////////////////////////////////////////////////////////////////////

    template <bool constant>
    class basic_iterator
        :
        public iter_impl<basic_iterator<constant>, std::conditional_t<constant, const_element_reference, element_reference>>
    {
    private:
        using impl      = iter_impl<basic_iterator<constant>, std::conditional_t<constant, const_element_reference, element_reference>>;
        using slot_ptr  = std::conditional_t<constant, slot const, slot> *;
        using reference = std::conditional_t<constant, const_element_reference, element_reference>;

        friend class arena;
        friend class basic_iterator<!constant>;

        basic_iterator( slot_ptr const base, slot_ptr const position, slot_ptr const end ) noexcept
            : base_{ base }, pos_{ position }, end_{ end }
        {
            skip_vacant();
        }

    public:
        constexpr basic_iterator() noexcept = default;
        template <bool other_constant> requires( constant && !other_constant )
        constexpr basic_iterator( basic_iterator<other_constant> const & other ) noexcept
            : base_{ other.base_ }, pos_{ other.pos_ }, end_{ other.end_ } {}

        reference operator*() const noexcept
        {
            BOOST_ASSERT( ( pos_ != end_ ) && pos_->occupied() );
            return { index_type::from_raw_parts( static_cast<size_type>( pos_ - base_ ), pos_->generation ), pos_->value };
        }

        basic_iterator & operator++() noexcept
        {
            BOOST_ASSERT( pos_ != end_ );
            ++pos_;
            skip_vacant();
            return *this;
        }
        basic_iterator & operator--() noexcept
        {
            do
            {
                BOOST_ASSERT_MSG( pos_ != base_, "Decrementing past the first element" );
                --pos_;
            } while ( !pos_->occupied() );
            return *this;
        }
        using impl::operator++;
        using impl::operator--;

        friend bool operator==( basic_iterator const & left, basic_iterator const & right ) noexcept { return left.pos_ == right.pos_; }

    private:
        void skip_vacant() noexcept
        {
            while ( ( pos_ != end_ ) && !pos_->occupied() )
                ++pos_;
        }

        slot_ptr base_{};
        slot_ptr pos_ {};
        slot_ptr end_ {};
    }; // class basic_iterator

public:
    using       iterator         = basic_iterator<false>;
    using const_iterator         = basic_iterator<true >;
    using       reverse_iterator = std::reverse_iterator<      iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

public:
    constexpr arena() noexcept = default;

    //! <b>Effects</b>: Constructs an empty arena with storage for at least
    //!   capacity slots.
    explicit arena( size_type const capacity ) { slots_.reserve( capacity ); }

    template <std::input_iterator It>
    arena( It const first, It const last ) { insert_range( std::ranges::subrange( first, last ) ); }

    arena( std::initializer_list<value_type> const values ) : arena( values.begin(), values.end() ) {}

    arena( arena const & ) = default;
    arena( arena && other ) noexcept
        :
        slots_    { std::move( other.slots_ ) },
        free_head_{ std::exchange( other.free_head_, null_slot ) },
        size_     { std::exchange( other.size_, size_type{ 0 } ) }
    {}

    arena & operator=( arena const & other ) { return *this = arena( other ); }
    arena & operator=( arena && other ) noexcept
    {
        slots_     = std::move( other.slots_ );
        free_head_ = std::exchange( other.free_head_, null_slot );
        size_      = std::exchange( other.size_, size_type{ 0 } );
        return *this;
    }

    ~arena() noexcept = default;

    void swap( arena & other ) noexcept
    {
        slots_.swap( other.slots_ );
        std::swap( free_head_, other.free_head_ );
        std::swap( size_     , other.size_      );
    }
    friend void swap( arena & left, arena & right ) noexcept { left.swap( right ); }

    //////////////////////////////////////////////
    //
    //                capacity
    //
    //////////////////////////////////////////////

    //! <b>Effects</b>: Returns the number of live (occupied) elements.
    [[ nodiscard, gnu::pure ]] size_type size () const noexcept { return size_; }
    [[ nodiscard, gnu::pure ]] bool      empty() const noexcept { return size_ == 0; }

    //! <b>Effects</b>: Returns the number of slots created so far (occupied,
    //!   vacant and retired).
    //!
    //! <b>Note</b>: Non-standard extension
    [[ nodiscard, gnu::pure ]] size_type slot_count() const noexcept { return static_cast<size_type>( slots_.size() ); }

    //! <b>Effects</b>: Returns the number of slots the arena can hold without
    //!   reallocating its storage.
    [[ nodiscard, gnu::pure ]] size_type capacity() const noexcept
    {
        return static_cast<size_type>( std::min<std::size_t>( slots_.capacity(), max_size() ) );
    }

    //! <b>Effects</b>: Returns the largest possible number of slots.
    [[ nodiscard ]] static constexpr size_type max_size() noexcept
    {
        auto constexpr storage_limit{ static_cast<std::uintmax_t>( std::numeric_limits<std::ptrdiff_t>::max() ) / sizeof( slot ) };
        return static_cast<size_type>( std::min<std::uintmax_t>( null_slot, storage_limit ) );
    }

    //! <b>Effects</b>: Makes room for additional more slots beyond the current
    //!   slot_count() without creating any.
    //!
    //! <b>Throws</b>: std::length_error if that would exceed max_size(),
    //!   std::bad_alloc on allocation failure.
    //!
    //! <b>Note</b>: Non-standard behaviour: the argument is relative (as
    //!   opposed to std::vector::reserve()).
    void reserve( size_type const additional )
    {
        if ( additional > static_cast<size_type>( max_size() - slot_count() ) ) [[ unlikely ]]
            detail::throw_reserve_overflow();
        slots_.reserve( std::size_t{ slot_count() } + additional );
    }

    //////////////////////////////////////////////
    //
    //                insertion
    //
    //////////////////////////////////////////////

    //! <b>Effects</b>: Constructs a new element from args in the most recently
    //!   vacated slot or, if there is none, in a newly appended slot.
    //!
    //! <b>Returns</b>: The index of the new element.
    //!
    //! <b>Throws</b>: Whatever exhaustion_handler does if max_size() slots are
    //!   already in use, whatever T's constructor or the storage throw.
    //!
    //! <b>Complexity</b>: Amortized constant time.
    template <typename ...Args>
    index_type emplace( Args &&...args )
    {
        auto const idx{ next_index() };
        if ( !idx ) [[ unlikely ]]
            exhaustion_handler();
        occupy( *idx, std::forward<Args>( args )... );
        return *idx;
    }

    index_type insert( value_type const &  value ) { return emplace( value            ); }
    index_type insert( value_type       && value ) { return emplace( std::move( value ) ); }

    //! <b>Effects</b>: Like insert() but the element is produced by
    //!   create( index ), called exactly once with the index the element will
    //!   be stored under (e.g. for self-referencing elements).
    //!
    //! <b>Requires</b>: create must not modify the arena.
    template <std::invocable<index_type> F>
    index_type insert_with( F && create )
    {
        auto const idx{ next_index() };
        if ( !idx ) [[ unlikely ]]
            exhaustion_handler();
        commit_with( *idx, std::forward<F>( create ) );
        return *idx;
    }

    //! <b>Effects</b>: Same as emplace() except that capacity exhaustion is
    //!   reported as arena_error::capacity_exhausted (args are then left
    //!   untouched).
    template <typename ...Args>
    fallible_result<index_type> try_emplace( Args &&...args )
    {
        auto const idx{ next_index() };
        if ( !idx ) [[ unlikely ]]
            return arena_error{ arena_error::capacity_exhausted };
        occupy( *idx, std::forward<Args>( args )... );
        return *idx;
    }

    fallible_result<index_type> try_insert( value_type const &  value ) { return try_emplace( value            ); }
    fallible_result<index_type> try_insert( value_type       && value ) { return try_emplace( std::move( value ) ); }

    //! <b>Effects</b>: Same as insert_with() except that capacity exhaustion
    //!   is reported as arena_error::capacity_exhausted (without calling
    //!   create).
    template <std::invocable<index_type> F>
    fallible_result<index_type> try_insert_with( F && create )
    {
        auto const idx{ next_index() };
        if ( !idx ) [[ unlikely ]]
            return arena_error{ arena_error::capacity_exhausted };
        commit_with( *idx, std::forward<F>( create ) );
        return *idx;
    }

    typed_index_type typed_insert( value_type const &  value ) { return typed_index_type{ insert( value            ) }; }
    typed_index_type typed_insert( value_type       && value ) { return typed_index_type{ insert( std::move( value ) ) }; }

    template <std::invocable<typed_index_type> F>
    typed_index_type typed_insert_with( F && create )
    {
        return typed_index_type
        {
            insert_with( [ &create ]( index_type const idx ) { return std::invoke( create, typed_index_type{ idx } ); } )
        };
    }

    template <std::ranges::input_range Rng>
    void insert_range( Rng && values )
    {
        for ( auto && value : values )
            static_cast<void>( emplace( std::forward<decltype( value )>( value ) ) );
    }

    //////////////////////////////////////////////
    //
    //                removal
    //
    //////////////////////////////////////////////

    //! <b>Effects</b>: If idx is valid, moves the element out, vacates its
    //!   slot and advances the slot's generation (retiring the slot if the
    //!   generation is already at its maximum). Invalid or stale indices are
    //!   ignored.
    //!
    //! <b>Returns</b>: The removed element or nullopt.
    //!
    //! <b>Complexity</b>: Constant.
    std::optional<value_type> remove( handle_for<T, index_type> auto const idx )
    {
        auto const target{ find( untyped( idx ) ) };
        if ( !target )
            return std::nullopt;
        std::optional<value_type> removed{ std::move( target->value ) };
        vacate( *target );
        return removed;
    }

    std::optional<value_type> typed_remove( typed_index_type const idx ) { return remove( idx ); }

    //! <b>Effects</b>: Destroys all elements. Every slot stays allocated but
    //!   is vacated with its generation advanced, so no index issued before
    //!   the call remains valid. Vacant slots are reused lowest position
    //!   first.
    //!
    //! <b>Complexity</b>: Linear in slot_count().
    void clear() noexcept
    {
        free_head_ = null_slot;
        for ( auto position{ slots_.size() }; position-- != 0; )
        {
            auto & target{ slots_[ position ] };
            switch ( target.state )
            {
                case slot_state::occupied:
                    std::destroy_at( &target.value );
                    release( target );
                    break;
                case slot_state::vacant:
                    target.next_free = free_head_;
                    free_head_       = static_cast<size_type>( position );
                    break;
                case slot_state::retired:
                    break;
            }
        }
        size_ = 0;
    }

    //! <b>Effects</b>: Calls keep( element ) (or keep( index, element ) if
    //!   that is how keep is invocable) exactly once for every element, in
    //!   ascending slot order, and removes those for which it returns false.
    //!
    //! <b>Requires</b>: keep must not insert into or remove from the arena.
    //!
    //! <b>Complexity</b>: Linear in slot_count().
    template <typename Predicate>
    void retain( Predicate && keep )
    {
        // removal never moves other slots so positions are walked independently of the free list
        for ( std::size_t position{ 0 }; position < slots_.size(); ++position )
        {
            auto & target{ slots_[ position ] };
            if ( !target.occupied() )
                continue;
            bool keep_element;
            if constexpr ( std::is_invocable_r_v<bool, Predicate &, index_type, value_type &> )
                keep_element = std::invoke( keep, index_type::from_raw_parts( static_cast<size_type>( position ), target.generation ), target.value );
            else
                keep_element = std::invoke( keep, target.value );
            if ( !keep_element )
                vacate( target );
        }
    }

    //! <b>Effects</b>: Returns a range that removes elements, in ascending
    //!   slot order (or descending through drain_range::next_back()), as
    //!   they are yielded. Elements not yet yielded when the range is
    //!   abandoned stay in the arena under their original indices.
    //!
    //! <b>Requires</b>: The arena must not be otherwise modified while the
    //!   range is in use.
    [[ nodiscard ]] drain_range drain() noexcept { return drain_range{ *this }; }

    //////////////////////////////////////////////
    //
    //               element access
    //
    //////////////////////////////////////////////

    [[ nodiscard, gnu::pure ]] bool contains( handle_for<T, index_type> auto const idx ) const noexcept { return find( untyped( idx ) ) != nullptr; }

    //! <b>Returns</b>: A pointer to the element idx refers to or nullptr if
    //!   idx is invalid, stale or (for dyn_index) made for another type.
    [[ nodiscard, gnu::pure ]] value_type * get( handle_for<T, index_type> auto const idx ) noexcept
    {
        auto const target{ find( untyped( idx ) ) };
        return target ? &target->value : nullptr;
    }
    [[ nodiscard, gnu::pure ]] value_type const * get( handle_for<T, index_type> auto const idx ) const noexcept
    {
        auto const target{ find( untyped( idx ) ) };
        return target ? &target->value : nullptr;
    }

    //! <b>Throws</b>: std::out_of_range if idx is invalid.
    [[ nodiscard ]] value_type       & at( handle_for<T, index_type> auto const idx )       { return checked( get( idx ) ); }
    [[ nodiscard ]] value_type const & at( handle_for<T, index_type> auto const idx ) const { return checked( get( idx ) ); }

    //! <b>Requires</b>: contains( idx ).
    [[ nodiscard ]] value_type & operator[]( handle_for<T, index_type> auto const idx ) noexcept
    {
        auto const element{ get( idx ) };
        BOOST_ASSERT_MSG( element, "Invalid or stale arena index" );
        return *element;
    }
    [[ nodiscard ]] value_type const & operator[]( handle_for<T, index_type> auto const idx ) const noexcept
    {
        auto const element{ get( idx ) };
        BOOST_ASSERT_MSG( element, "Invalid or stale arena index" );
        return *element;
    }

    //! <b>Effects</b>: Simultaneous mutable access to two elements. Refused
    //!   with arena_error::aliased_slots whenever both indices name the same
    //!   slot position, regardless of their generations or validity.
    //!
    //! <b>Returns</b>: The pair of element pointers, each one nullptr if the
    //!   corresponding index is invalid.
    [[ nodiscard ]] result_or_error<std::pair<value_type *, value_type *>>
    get_pair( handle_for<T, index_type> auto const first, handle_for<T, index_type> auto const second )
    {
        if ( raw( first ).slot() == raw( second ).slot() ) [[ unlikely ]]
            return arena_error{ arena_error::aliased_slots };
        return std::pair{ get( first ), get( second ) };
    }

    //! <b>Effects</b>: Looks up the element at a slot position without
    //!   knowing its generation.
    //!
    //! <b>Returns</b>: The element together with its current index or
    //!   nullopt if the position is out of range or not occupied.
    //!
    //! <b>Note</b>: Non-standard extension
    [[ nodiscard ]] std::optional<element_reference> get_unknown_gen( size_type const position ) noexcept
    {
        if ( position >= slots_.size() )
            return std::nullopt;
        auto & target{ slots_[ position ] };
        if ( !target.occupied() )
            return std::nullopt;
        return element_reference{ index_type::from_raw_parts( position, target.generation ), target.value };
    }
    [[ nodiscard ]] std::optional<const_element_reference> get_unknown_gen( size_type const position ) const noexcept
    {
        if ( position >= slots_.size() )
            return std::nullopt;
        auto & target{ slots_[ position ] };
        if ( !target.occupied() )
            return std::nullopt;
        return const_element_reference{ index_type::from_raw_parts( position, target.generation ), target.value };
    }

    //////////////////////////////////////////////
    //
    //                iterators
    //
    //////////////////////////////////////////////

    [[ nodiscard ]]       iterator  begin()       noexcept { return {  data(),  data(), data_end() }; }
    [[ nodiscard ]] const_iterator  begin() const noexcept { return {  data(),  data(), data_end() }; }
    [[ nodiscard ]]       iterator  end  ()       noexcept { return {  data(), data_end(), data_end() }; }
    [[ nodiscard ]] const_iterator  end  () const noexcept { return {  data(), data_end(), data_end() }; }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end  (); }

    [[ nodiscard ]]       reverse_iterator  rbegin()       noexcept { return       reverse_iterator{ end() }; }
    [[ nodiscard ]] const_reverse_iterator  rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    [[ nodiscard ]]       reverse_iterator  rend  ()       noexcept { return       reverse_iterator{ begin() }; }
    [[ nodiscard ]] const_reverse_iterator  rend  () const noexcept { return const_reverse_iterator{ begin() }; }
    [[ nodiscard ]] const_reverse_iterator crbegin() const noexcept { return rbegin(); }
    [[ nodiscard ]] const_reverse_iterator crend  () const noexcept { return rend  (); }

    //! <b>Effects</b>: Returns a sized, bidirectional view of the (index,
    //!   element) pairs of all occupied slots in ascending slot order.
    [[ nodiscard ]] auto iter() noexcept
    {
        return std::ranges::subrange<iterator, iterator, std::ranges::subrange_kind::sized>{ begin(), end(), size() };
    }
    [[ nodiscard ]] auto iter() const noexcept
    {
        return std::ranges::subrange<const_iterator, const_iterator, std::ranges::subrange_kind::sized>{ begin(), end(), size() };
    }

    //////////////////////////////////////////////
    //
    //                snapshots
    //
    //////////////////////////////////////////////

    //! <b>Effects</b>: Rebuilds an arena from a sequence of snapshot_entry
    //!   values, one per slot. Occupied slots keep their generation (so
    //!   indices issued before the snapshot stay valid), vacant slots restart
    //!   at the highest generation found in the snapshot and are reused
    //!   lowest position first.
    //!
    //! <b>Returns</b>: arena_error::malformed_snapshot if the sequence is
    //!   longer than max_size().
    template <std::ranges::input_range Snapshot>
    [[ nodiscard ]] static fallible_result<arena> from_snapshot( Snapshot && entries )
    {
        arena restored;
        if constexpr ( std::ranges::sized_range<Snapshot> )
        {
            if ( std::ranges::size( entries ) > max_size() ) [[ unlikely ]]
                return arena_error{ arena_error::malformed_snapshot };
            restored.slots_.reserve( std::ranges::size( entries ) );
        }

        generation_type baseline{ 0 };
        for ( auto && entry : entries )
        {
            if ( restored.slots_.size() == max_size() ) [[ unlikely ]]
                return arena_error{ arena_error::malformed_snapshot };
            if ( entry )
            {
                auto const generation{ entry->first };
                if constexpr ( std::is_lvalue_reference_v<Snapshot> )
                    restored.slots_.emplace_back( std::in_place, generation, entry->second );
                else
                    restored.slots_.emplace_back( std::in_place, generation, std::move( entry->second ) );
                baseline = std::max( baseline, generation );
                ++restored.size_;
            }
            else
            {
                restored.slots_.emplace_back( generation_type{ 0 }, null_slot );
            }
        }

        for ( auto position{ restored.slots_.size() }; position-- != 0; )
        {
            auto & target{ restored.slots_[ position ] };
            if ( target.occupied() )
                continue;
            target.generation  = baseline;
            target.next_free   = restored.free_head_;
            restored.free_head_ = static_cast<size_type>( position );
        }
        return std::move( restored );
    }

    // same elements under the same indices (vacant slot bookkeeping is not compared)
    friend bool operator==( arena const & left, arena const & right )
    {
        return ( left.size() == right.size() ) && std::ranges::equal( left, right );
    }

private:
    [[ gnu::pure ]] slot       * data    ()       noexcept { return slots_.data(); }
    [[ gnu::pure ]] slot const * data    () const noexcept { return slots_.data(); }
    [[ gnu::pure ]] slot       * data_end()       noexcept { return slots_.data() + slots_.size(); }
    [[ gnu::pure ]] slot const * data_end() const noexcept { return slots_.data() + slots_.size(); }

    [[ gnu::const ]] static index_type raw( index_type       const   idx ) noexcept { return idx; }
    [[ gnu::const ]] static index_type raw( typed_index_type const   idx ) noexcept { return idx.untyped(); }
    [[ gnu::pure  ]] static index_type raw( dyn_index_type   const & idx ) noexcept { return idx.untyped(); }

    [[ gnu::const ]] static index_type untyped( index_type       const   idx ) noexcept { return idx; }
    [[ gnu::const ]] static index_type untyped( typed_index_type const   idx ) noexcept { return idx.untyped(); }
    // a handle made for another element type never resolves
    [[ gnu::pure  ]] static index_type untyped( dyn_index_type   const & idx ) noexcept
    {
        return idx.template holds<value_type>() ? idx.untyped() : index_type::from_raw_parts( null_slot, 0 );
    }

    [[ gnu::pure ]] slot const * find( index_type const idx ) const noexcept
    {
        auto const position{ idx.slot() };
        if ( position >= slots_.size() )
            return nullptr;
        auto & target{ slots_[ position ] };
        if ( !target.occupied() || ( target.generation != idx.generation() ) )
            return nullptr;
        return &target;
    }
    [[ gnu::pure ]] slot * find( index_type const idx ) noexcept { return const_cast<slot *>( std::as_const( *this ).find( idx ) ); }

    template <typename Element>
    static Element & checked( Element * const element )
    {
        if ( !element ) [[ unlikely ]]
            detail::throw_out_of_range();
        return *element;
    }

    // where the next insertion goes: the free list head or a new slot at generation 0
    [[ gnu::pure ]] std::optional<index_type> next_index() const noexcept
    {
        if ( free_head_ != null_slot )
            return index_type::from_raw_parts( free_head_, slots_[ free_head_ ].generation );
        if ( slots_.size() < max_size() ) [[ likely ]]
            return index_type::from_raw_parts( slot_count(), 0 );
        return std::nullopt;
    }

    // Constructs the element in the slot next_index() designated. The free
    // list is relinked only after the construction succeeded.
    template <typename ...Args>
    void occupy( index_type const idx, Args &&...args )
    {
        auto const position{ idx.slot() };
        if ( position == free_head_ )
        {
            auto & target{ slots_[ position ] };
            BOOST_ASSERT( target.vacant() && ( target.generation == idx.generation() ) );
            std::construct_at( &target.value, std::forward<Args>( args )... );
            free_head_   = target.next_free;
            target.state = slot_state::occupied;
        }
        else
        {
            BOOST_ASSERT( ( position == slots_.size() ) && ( idx.generation() == 0 ) );
            slots_.emplace_back( std::in_place, generation_type{ 0 }, std::forward<Args>( args )... );
        }
        ++size_;
    }

    template <typename F>
    void commit_with( index_type const idx, F && create )
    {
        auto && value{ std::invoke( std::forward<F>( create ), idx ) };
        BOOST_ASSERT_MSG( next_index() == idx, "Arena modified from within an insert_with() callback" );
        occupy( idx, std::forward<decltype( value )>( value ) );
    }

    // puts an emptied slot back on the free list or, once its generation is
    // exhausted, retires it
    void release( slot & target ) noexcept
    {
        if ( target.generation == std::numeric_limits<generation_type>::max() ) [[ unlikely ]]
        {
            target.state = slot_state::retired;
            return;
        }
        ++target.generation;
        target.next_free = free_head_;
        target.state     = slot_state::vacant;
        free_head_       = static_cast<size_type>( &target - slots_.data() );
    }

    void vacate( slot & target ) noexcept
    {
        BOOST_ASSERT( target.occupied() );
        std::destroy_at( &target.value );
        release( target );
        --size_;
    }

    std::optional<std::pair<index_type, value_type>> take( std::size_t const position )
    {
        auto & target{ slots_[ position ] };
        if ( !target.occupied() )
            return std::nullopt;
        std::optional<std::pair<index_type, value_type>> taken
        {
            std::in_place,
            index_type::from_raw_parts( static_cast<size_type>( position ), target.generation ),
            std::move( target.value )
        };
        vacate( target );
        return taken;
    }

private:
    storage   slots_;
    size_type free_head_{ null_slot };
    size_type size_     { 0 };
}; // class arena


////////////////////////////////////////////////////////////////////////////////
// \class arena::drain_range
////////////////////////////////////////////////////////////////////////////////

template <typename T, std::unsigned_integral sz_t, std::unsigned_integral generation_t, auto exhaustion_handler>
class arena<T, sz_t, generation_t, exhaustion_handler>::drain_range
{
public:
    using value_type = std::pair<index_type, T>;

    class iterator;

    explicit drain_range( arena & source ) noexcept : arena_{ &source }, front_{ 0 }, back_{ source.slots_.size() } {}

    //! <b>Effects</b>: Removes the remaining element with the lowest slot
    //!   position.
    //! <b>Returns</b>: It with its (now stale) index, or nullopt when done.
    std::optional<value_type> next()
    {
        while ( front_ != back_ )
        {
            if ( auto taken{ arena_->take( front_++ ) } )
                return taken;
        }
        return std::nullopt;
    }

    //! <b>Effects</b>: Removes the remaining element with the highest slot
    //!   position.
    std::optional<value_type> next_back()
    {
        while ( front_ != back_ )
        {
            if ( auto taken{ arena_->take( --back_ ) } )
                return taken;
        }
        return std::nullopt;
    }

    // everything outside [front_, back_) has already been taken
    [[ nodiscard, gnu::pure ]] size_type size () const noexcept { return arena_->size(); }
    [[ nodiscard, gnu::pure ]] bool      empty() const noexcept { return arena_->empty(); }

    iterator                begin();
    std::default_sentinel_t end  () const noexcept { return {}; }

private:
    arena *     arena_;
    std::size_t front_;
    std::size_t back_;
}; // class drain_range

////////////////////////////////////////////////////////////////////////////////
// \class arena::drain_range::iterator
// Single pass: an element is removed from the arena when the iterator reaches
// it.
////////////////////////////////////////////////////////////////////////////////

template <typename T, std::unsigned_integral sz_t, std::unsigned_integral generation_t, auto exhaustion_handler>
class arena<T, sz_t, generation_t, exhaustion_handler>::drain_range::iterator
{
public:
    using iterator_concept = std::input_iterator_tag;
    using value_type       = typename drain_range::value_type;
    using difference_type  = std::ptrdiff_t;

    iterator() noexcept = default;
    explicit iterator( drain_range & range ) : range_{ &range } { advance(); }

    value_type & operator*() const noexcept { BOOST_ASSERT( current_ ); return *current_; }
    value_type * operator->() const noexcept { return &**this; }

    iterator & operator++() { advance(); return *this; }
    void       operator++( int ) { advance(); }

    friend bool operator==( iterator const & it, std::default_sentinel_t ) noexcept { return !it.current_; }

private:
    void advance()
    {
        current_.reset();
        if ( auto taken{ range_->next() } )
            current_.emplace( std::move( *taken ) );
    }

    drain_range *                     range_{};
    mutable std::optional<value_type> current_;
}; // class drain_range::iterator

template <typename T, std::unsigned_integral sz_t, std::unsigned_integral generation_t, auto exhaustion_handler>
typename arena<T, sz_t, generation_t, exhaustion_handler>::drain_range::iterator
arena<T, sz_t, generation_t, exhaustion_handler>::drain_range::begin() { return iterator{ *this }; }

//------------------------------------------------------------------------------
} // namespace psi::genarena
//------------------------------------------------------------------------------
